// include/adapters/primary/HttpErrors.hpp
#pragma once

#include <IRequest.hpp>
#include <IResponse.hpp>
#include "domain/Result.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>

namespace bank::adapters::primary
{

    /**
     * @brief HTTP статус для вида ошибки
     *
     * - валидация, INSUFFICIENT_FUNDS → 400
     * - ACCOUNT_NOT_FOUND → 404
     * - ACCOUNT_ALREADY_EXISTS, CONCURRENCY_CONFLICT → 409
     */
    inline int httpStatusFor(domain::ErrorKind kind)
    {
        switch (kind)
        {
        case domain::ErrorKind::ACCOUNT_NOT_FOUND:
            return 404;
        case domain::ErrorKind::ACCOUNT_ALREADY_EXISTS:
        case domain::ErrorKind::CONCURRENCY_CONFLICT:
            return 409;
        default:
            return 400;
        }
    }

    inline void sendError(IResponse &res, int status, const std::string &message)
    {
        nlohmann::json error;
        error["error"] = message;
        res.setResult(status, "application/json", error.dump());
    }

    /**
     * @brief Ответ для ошибки операции: {"error": message, "code": KIND}
     */
    inline void sendError(IResponse &res, const domain::Error &error)
    {
        nlohmann::json body;
        body["error"] = error.message;
        body["code"] = domain::toString(error.kind);
        res.setResult(httpStatusFor(error.kind), "application/json", body.dump());
    }

    /**
     * @brief Сумма в центах из тела запроса
     *
     * Поле может отсутствовать (тогда 0). Присутствующее поле обязано быть
     * целым JSON-числом в диапазоне int64: 12.9, true, "100" отвергаются.
     *
     * @return std::nullopt если значение не целое число центов
     */
    inline std::optional<int64_t> readAmountCents(const nlohmann::json &body, const std::string &key)
    {
        auto it = body.find(key);
        if (it == body.end())
        {
            return int64_t{0};
        }
        if (it->is_number_unsigned())
        {
            auto value = it->get<uint64_t>();
            if (value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
            {
                return std::nullopt;
            }
            return static_cast<int64_t>(value);
        }
        if (it->is_number_integer())
        {
            return it->get<int64_t>();
        }
        return std::nullopt;
    }

    inline void sendInvalidAmount(IResponse &res, const std::string &key)
    {
        sendError(res, domain::Error{domain::ErrorKind::INVALID_AMOUNT,
                                     key + " must be an integer number of cents"});
    }

    /**
     * @brief Номер счёта из /api/v1/accounts/{number}/...
     *
     * Роутер передаёт номер первым параметром пути;
     * без паттерна номер берётся из самого пути.
     */
    inline std::string extractAccountNumber(IRequest &req)
    {
        auto param = req.getPathParam(0);
        if (param && !param->empty())
        {
            return *param;
        }

        static const std::string prefix = "/api/v1/accounts/";
        std::string path = req.getPath();
        size_t query = path.find('?');
        if (query != std::string::npos)
        {
            path = path.substr(0, query);
        }
        if (path.rfind(prefix, 0) != 0)
        {
            return "";
        }
        std::string rest = path.substr(prefix.size());
        return rest.substr(0, rest.find('/'));
    }

} // namespace bank::adapters::primary
