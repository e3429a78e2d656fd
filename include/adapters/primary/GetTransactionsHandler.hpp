#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/HttpErrors.hpp"
#include "ports/input/IAccountService.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace bank::adapters::primary
{

    /**
     * @brief GET /api/v1/accounts/{number}/transactions - история проводок
     *
     * Ответ - JSON-массив проводок, новые первыми.
     */
    class GetTransactionsHandler : public IHttpHandler
    {
    public:
        explicit GetTransactionsHandler(std::shared_ptr<ports::input::IAccountService> accountService)
            : accountService_(std::move(accountService))
        {
            std::cout << "[GetTransactionsHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            if (req.getMethod() != "GET")
            {
                sendError(res, 405, "Method not allowed");
                return;
            }

            try
            {
                auto accountNumber = extractAccountNumber(req);
                auto result = accountService_->getTransactions(accountNumber);
                if (!result)
                {
                    sendError(res, result.error());
                    return;
                }

                nlohmann::json response = nlohmann::json::array();
                for (const auto &entry : result.value())
                {
                    response.push_back(entryToJson(entry));
                }

                res.setResult(200, "application/json", response.dump());
            }
            catch (const std::exception &e)
            {
                std::cerr << "[GetTransactionsHandler] Error: " << e.what() << std::endl;
                sendError(res, 500, "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::IAccountService> accountService_;

        nlohmann::json entryToJson(const ports::input::LedgerEntryView &entry)
        {
            nlohmann::json j;
            j["entry_id"] = entry.entryId;
            j["entry_type"] = domain::toString(entry.entryType);
            j["amount_cents"] = entry.amountCents;
            j["currency"] = entry.currency;
            j["correlation_id"] = entry.correlationId
                ? nlohmann::json(*entry.correlationId) : nlohmann::json(nullptr);
            j["counterparty_account_number"] = entry.counterpartyAccountNumber
                ? nlohmann::json(*entry.counterpartyAccountNumber) : nlohmann::json(nullptr);
            j["occurred_at"] = entry.occurredAt.toString();
            return j;
        }
    };

} // namespace bank::adapters::primary
