// include/adapters/secondary/PostgresUnitOfWork.hpp
#pragma once

#include "ports/output/IUnitOfWork.hpp"
#include "adapters/secondary/PostgresAccountRepository.hpp"
#include "adapters/secondary/PostgresLedgerRepository.hpp"
#include "adapters/secondary/PostgresErrors.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>
#include <stdexcept>

namespace bank::adapters::secondary {

/**
 * @brief Транзакция PostgreSQL: одно соединение + одна pqxx::work
 *
 * В начале транзакции выставляется SET LOCAL lock_timeout, поэтому
 * SELECT ... FOR UPDATE не ждёт дольше настроенного таймаута.
 */
class PostgresUnitOfWork : public ports::output::IUnitOfWork {
public:
    explicit PostgresUnitOfWork(const settings::DbSettings& settings)
        : connection_(std::make_unique<pqxx::connection>(settings.getConnectionString()))
        , txn_(std::make_unique<pqxx::work>(*connection_))
        , accounts_(*txn_, settings.isRowLockingEnabled())
        , ledger_(*txn_)
    {
        txn_->exec("SET LOCAL lock_timeout = '" + std::to_string(settings.getLockTimeoutMs()) + "ms'");
    }

    ~PostgresUnitOfWork() override {
        try {
            rollback();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresUnitOfWork] rollback in destructor failed: " << e.what() << std::endl;
        }
    }

    PostgresUnitOfWork(const PostgresUnitOfWork&) = delete;
    PostgresUnitOfWork& operator=(const PostgresUnitOfWork&) = delete;

    ports::output::IAccountRepository& accounts() override {
        ensureActive();
        return accounts_;
    }

    ports::output::ILedgerRepository& ledger() override {
        ensureActive();
        return ledger_;
    }

    domain::Status commit() override {
        ensureActive();
        active_ = false;

        try {
            txn_->commit();
            return domain::Status::success();

        } catch (const pqxx::sql_error& e) {
            if (isConcurrencySqlState(e.sqlstate())) {
                std::cerr << "[PostgresUnitOfWork] Commit conflict (SQLSTATE "
                          << e.sqlstate() << ")" << std::endl;
                return domain::Status::failure(domain::ErrorKind::CONCURRENCY_CONFLICT,
                    std::string("Commit failed: ") + e.what());
            }
            std::cerr << "[PostgresUnitOfWork] commit error: " << e.what() << std::endl;
            throw;
        }
    }

    void rollback() override {
        if (!active_) {
            return;
        }
        active_ = false;
        txn_->abort();
    }

    bool isActive() const override { return active_; }

private:
    std::unique_ptr<pqxx::connection> connection_;
    std::unique_ptr<pqxx::work> txn_;
    PostgresAccountRepository accounts_;
    PostgresLedgerRepository ledger_;
    bool active_ = true;

    void ensureActive() const {
        if (!active_) {
            throw std::logic_error("Unit of work is already finished");
        }
    }
};

/**
 * @brief Фабрика транзакций PostgreSQL
 *
 * При создании инициализирует схему (CREATE TABLE IF NOT EXISTS).
 */
class PostgresUnitOfWorkFactory : public ports::output::IUnitOfWorkFactory {
public:
    explicit PostgresUnitOfWorkFactory(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        initSchema();
    }

    std::unique_ptr<ports::output::IUnitOfWork> begin() override {
        return std::make_unique<PostgresUnitOfWork>(*settings_);
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    void initSchema() {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS accounts (
                    account_id VARCHAR(36) PRIMARY KEY,
                    account_number VARCHAR(12) NOT NULL UNIQUE,
                    balance_cents BIGINT NOT NULL CHECK (balance_cents >= 0),
                    currency CHAR(3) NOT NULL,
                    version BIGINT NOT NULL
                )
            )");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS ledger_entries (
                    seq BIGSERIAL,
                    entry_id VARCHAR(36) PRIMARY KEY,
                    account_id VARCHAR(36) NOT NULL
                        REFERENCES accounts(account_id) DEFERRABLE INITIALLY DEFERRED,
                    entry_type VARCHAR(16) NOT NULL,
                    amount_cents BIGINT NOT NULL CHECK (amount_cents > 0),
                    currency CHAR(3) NOT NULL,
                    correlation_id VARCHAR(36),
                    counterparty_account_number VARCHAR(12),
                    occurred_at TIMESTAMPTZ NOT NULL
                )
            )");

            txn.exec(R"(
                CREATE INDEX IF NOT EXISTS idx_ledger_entries_account
                ON ledger_entries(account_id, seq)
            )");

            txn.commit();
            std::cout << "[PostgresUnitOfWorkFactory] Schema initialized" << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresUnitOfWorkFactory] initSchema error: " << e.what() << std::endl;
            throw;
        }
    }
};

} // namespace bank::adapters::secondary
