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
     * @brief POST /api/v1/accounts - открыть счёт
     *
     * Body: {"account_number": "123456", "initial_balance_cents": 10000, "currency": "BRL"}
     * 201 - счёт создан, 409 - номер занят.
     */
    class CreateAccountHandler : public IHttpHandler
    {
    public:
        explicit CreateAccountHandler(std::shared_ptr<ports::input::IAccountService> accountService)
            : accountService_(std::move(accountService))
        {
            std::cout << "[CreateAccountHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            if (req.getMethod() != "POST")
            {
                sendError(res, 405, "Method not allowed");
                return;
            }

            try
            {
                auto body = nlohmann::json::parse(req.getBody());

                ports::input::CreateAccountCommand command;
                command.accountNumber = body.value("account_number", "");
                auto amount = readAmountCents(body, "initial_balance_cents");
                if (!amount)
                {
                    sendInvalidAmount(res, "initial_balance_cents");
                    return;
                }
                command.initialBalanceCents = *amount;
                command.currency = body.value("currency", std::string(domain::Money::DEFAULT_CURRENCY));

                auto result = accountService_->createAccount(command);
                if (!result)
                {
                    sendError(res, result.error());
                    return;
                }

                const auto &created = result.value();
                nlohmann::json response;
                response["account_id"] = created.accountId;
                response["account_number"] = created.accountNumber;
                response["balance_cents"] = created.balanceCents;
                response["currency"] = created.currency;

                res.setResult(201, "application/json", response.dump());
            }
            catch (const nlohmann::json::exception &e)
            {
                sendError(res, 400, "Invalid JSON");
            }
            catch (const std::exception &e)
            {
                std::cerr << "[CreateAccountHandler] Error: " << e.what() << std::endl;
                sendError(res, 500, "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::IAccountService> accountService_;
    };

} // namespace bank::adapters::primary
