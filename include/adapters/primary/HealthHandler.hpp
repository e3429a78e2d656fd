#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "ports/output/IUnitOfWork.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>

namespace bank::adapters::primary {

/**
 * @brief GET /health - сервис жив и хранилище отвечает
 *
 * Открывает и сразу откатывает транзакцию. 503, если хранилище недоступно.
 */
class HealthHandler : public IHttpHandler {
public:
    explicit HealthHandler(std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory)
        : uowFactory_(std::move(uowFactory)) {}

    void handle(IRequest& req, IResponse& res) override {
        nlohmann::json response;
        response["service"] = "bank-service";

        try {
            auto uow = uowFactory_->begin();
            uow->rollback();
            response["status"] = "healthy";
            response["storage"] = "up";
            res.setResult(200, "application/json", response.dump());
        } catch (const std::exception& e) {
            std::cerr << "[HealthHandler] Storage check failed: " << e.what() << std::endl;
            response["status"] = "unhealthy";
            response["storage"] = "down";
            res.setResult(503, "application/json", response.dump());
        }
    }

private:
    std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory_;
};

} // namespace bank::adapters::primary
