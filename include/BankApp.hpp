// include/BankApp.hpp
#pragma once

#include <BoostBeastApplication.hpp>
#include <boost/di.hpp>

// Settings
#include "settings/DbSettings.hpp"
#include "settings/RetrySettings.hpp"
#include "settings/StorageSettings.hpp"

// Ports
#include "ports/input/IAccountService.hpp"
#include "ports/input/ITransferService.hpp"
#include "ports/output/IUnitOfWork.hpp"

// Application
#include "application/AccountService.hpp"
#include "application/TransferService.hpp"

// Secondary Adapters
#include "adapters/secondary/InMemoryBankStore.hpp"
#include "adapters/secondary/InMemoryUnitOfWork.hpp"
#include "adapters/secondary/PostgresUnitOfWork.hpp"

// Primary Adapters
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/CreateAccountHandler.hpp"
#include "adapters/primary/GetBalanceHandler.hpp"
#include "adapters/primary/DepositHandler.hpp"
#include "adapters/primary/WithdrawHandler.hpp"
#include "adapters/primary/GetTransactionsHandler.hpp"
#include "adapters/primary/TransferHandler.hpp"

#include <chrono>
#include <iostream>
#include <memory>

namespace di = boost::di;

namespace bank
{

    /**
     * @brief Bank Service Application
     *
     * HTTP: счета, зачисления/списания, переводы, история проводок.
     * Хранилище выбирается BANK_STORAGE: postgres (по умолчанию) или memory.
     */
    class BankApp : public BoostBeastApplication
    {
    public:
        BankApp() { std::cout << "[BankApp] Initializing..." << std::endl; }
        ~BankApp() override { std::cout << "[BankApp] Shutting down..." << std::endl; }

    protected:
        void loadEnvironment(int argc, char *argv[]) override
        {
            BoostBeastApplication::loadEnvironment(argc, argv);
            std::cout << "[BankApp] Environment loaded" << std::endl;
        }

        void configureInjection() override
        {
            std::cout << "[BankApp] Configuring DI..." << std::endl;

            // Шаг 1: Хранилище - instance binding, выбор по окружению
            auto uowFactory = createUnitOfWorkFactory();

            // Шаг 2: Основной injector
            auto injector = di::make_injector(
                di::bind<settings::IRetrySettings>().to<settings::RetrySettings>().in(di::singleton),
                di::bind<ports::output::IUnitOfWorkFactory>().to(uowFactory),

                di::bind<ports::input::IAccountService>().to<application::AccountService>().in(di::singleton),
                di::bind<ports::input::ITransferService>().to<application::TransferService>().in(di::singleton));

            // Шаг 3: HTTP Handlers
            handlers_[getHandlerKey("GET", "/health")] = injector.create<std::shared_ptr<adapters::primary::HealthHandler>>();

            handlers_[getHandlerKey("POST", "/api/v1/accounts")] =
                injector.create<std::shared_ptr<adapters::primary::CreateAccountHandler>>();
            handlers_[getHandlerKey("GET", "/api/v1/accounts/*/balance")] =
                injector.create<std::shared_ptr<adapters::primary::GetBalanceHandler>>();
            handlers_[getHandlerKey("POST", "/api/v1/accounts/*/deposit")] =
                injector.create<std::shared_ptr<adapters::primary::DepositHandler>>();
            handlers_[getHandlerKey("POST", "/api/v1/accounts/*/withdraw")] =
                injector.create<std::shared_ptr<adapters::primary::WithdrawHandler>>();
            handlers_[getHandlerKey("GET", "/api/v1/accounts/*/transactions")] =
                injector.create<std::shared_ptr<adapters::primary::GetTransactionsHandler>>();

            handlers_[getHandlerKey("POST", "/api/v1/transfers")] =
                injector.create<std::shared_ptr<adapters::primary::TransferHandler>>();

            std::cout << "[BankApp] Ready" << std::endl;
        }

    private:
        std::shared_ptr<ports::output::IUnitOfWorkFactory> createUnitOfWorkFactory()
        {
            settings::StorageSettings storage;
            auto dbSettings = std::make_shared<settings::DbSettings>();

            if (storage.getBackend() == settings::StorageSettings::Backend::MEMORY)
            {
                auto mode = dbSettings->isRowLockingEnabled()
                                ? adapters::secondary::InMemoryBankStore::LockingMode::PESSIMISTIC
                                : adapters::secondary::InMemoryBankStore::LockingMode::OPTIMISTIC_ONLY;
                auto store = std::make_shared<adapters::secondary::InMemoryBankStore>(
                    mode, std::chrono::milliseconds(dbSettings->getLockTimeoutMs()));

                std::cout << "[BankApp] Storage: memory" << std::endl;
                return std::make_shared<adapters::secondary::InMemoryUnitOfWorkFactory>(store);
            }

            std::cout << "[BankApp] Storage: postgres " << dbSettings->getHost()
                      << ":" << dbSettings->getPort() << "/" << dbSettings->getName() << std::endl;
            return std::make_shared<adapters::secondary::PostgresUnitOfWorkFactory>(dbSettings);
        }
    };

} // namespace bank
