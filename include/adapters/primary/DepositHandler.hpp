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
     * @brief POST /api/v1/accounts/{number}/deposit - зачисление
     *
     * Body: {"amount_cents": 5000, "currency": "BRL"}
     */
    class DepositHandler : public IHttpHandler
    {
    public:
        explicit DepositHandler(std::shared_ptr<ports::input::IAccountService> accountService)
            : accountService_(std::move(accountService))
        {
            std::cout << "[DepositHandler] Created" << std::endl;
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

                ports::input::DepositCommand command;
                command.accountNumber = extractAccountNumber(req);
                auto amount = readAmountCents(body, "amount_cents");
                if (!amount)
                {
                    sendInvalidAmount(res, "amount_cents");
                    return;
                }
                command.amountCents = *amount;
                command.currency = body.value("currency", std::string(domain::Money::DEFAULT_CURRENCY));

                auto result = accountService_->deposit(command);
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
            catch (const nlohmann::json::exception &e)
            {
                sendError(res, 400, "Invalid JSON");
            }
            catch (const std::exception &e)
            {
                std::cerr << "[DepositHandler] Error: " << e.what() << std::endl;
                sendError(res, 500, "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::IAccountService> accountService_;
    };

} // namespace bank::adapters::primary
