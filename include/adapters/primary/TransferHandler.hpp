#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/HttpErrors.hpp"
#include "ports/input/ITransferService.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace bank::adapters::primary
{

    /**
     * @brief POST /api/v1/transfers - перевод между счетами
     *
     * Body: {"from_account_number": "123456", "to_account_number": "654321",
     *        "amount_cents": 3000, "currency": "BRL"}
     *
     * 409 CONCURRENCY_CONFLICT - попытки исчерпаны, запрос можно повторить.
     */
    class TransferHandler : public IHttpHandler
    {
    public:
        explicit TransferHandler(std::shared_ptr<ports::input::ITransferService> transferService)
            : transferService_(std::move(transferService))
        {
            std::cout << "[TransferHandler] Created" << std::endl;
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

                ports::input::TransferCommand command;
                command.fromAccountNumber = body.value("from_account_number", "");
                command.toAccountNumber = body.value("to_account_number", "");
                auto amount = readAmountCents(body, "amount_cents");
                if (!amount)
                {
                    sendInvalidAmount(res, "amount_cents");
                    return;
                }
                command.amountCents = *amount;
                command.currency = body.value("currency", std::string(domain::Money::DEFAULT_CURRENCY));

                auto result = transferService_->transfer(command);
                if (!result)
                {
                    sendError(res, result.error());
                    return;
                }

                const auto &transfer = result.value();
                nlohmann::json response;
                response["correlation_id"] = transfer.correlationId;
                response["from_account_number"] = transfer.fromAccountNumber;
                response["to_account_number"] = transfer.toAccountNumber;
                response["from_balance_cents"] = transfer.fromBalanceCents;
                response["to_balance_cents"] = transfer.toBalanceCents;
                response["currency"] = transfer.currency;

                res.setResult(200, "application/json", response.dump());
            }
            catch (const nlohmann::json::exception &e)
            {
                sendError(res, 400, "Invalid JSON");
            }
            catch (const std::exception &e)
            {
                std::cerr << "[TransferHandler] Error: " << e.what() << std::endl;
                sendError(res, 500, "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::ITransferService> transferService_;
    };

} // namespace bank::adapters::primary
