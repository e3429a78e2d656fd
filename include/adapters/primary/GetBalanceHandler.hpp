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
     * @brief GET /api/v1/accounts/{number}/balance - текущий баланс
     */
    class GetBalanceHandler : public IHttpHandler
    {
    public:
        explicit GetBalanceHandler(std::shared_ptr<ports::input::IAccountService> accountService)
            : accountService_(std::move(accountService))
        {
            std::cout << "[GetBalanceHandler] Created" << std::endl;
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
                auto result = accountService_->getBalance(extractAccountNumber(req));
                if (!result)
                {
                    sendError(res, result.error());
                    return;
                }

                nlohmann::json response;
                response["account_number"] = result.value().accountNumber;
                response["balance_cents"] = result.value().balanceCents;
                response["currency"] = result.value().currency;

                res.setResult(200, "application/json", response.dump());
            }
            catch (const std::exception &e)
            {
                std::cerr << "[GetBalanceHandler] Error: " << e.what() << std::endl;
                sendError(res, 500, "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::IAccountService> accountService_;
    };

} // namespace bank::adapters::primary
