// include/adapters/secondary/PostgresAccountRepository.hpp
#pragma once

#include "ports/output/IAccountRepository.hpp"
#include "adapters/secondary/PostgresErrors.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <stdexcept>

namespace bank::adapters::secondary {

/**
 * @brief PostgreSQL реализация репозитория счетов в рамках одной pqxx::work
 *
 * Таблица: accounts
 * - account_id VARCHAR(36) PRIMARY KEY
 * - account_number VARCHAR(12) NOT NULL UNIQUE
 * - balance_cents BIGINT NOT NULL CHECK (balance_cents >= 0)
 * - currency CHAR(3) NOT NULL
 * - version BIGINT NOT NULL
 *
 * Блокировка - SELECT ... FOR UPDATE (ожидание ограничено lock_timeout,
 * выставленным PostgresUnitOfWork). Запись - UPDATE ... WHERE version = $expected.
 */
class PostgresAccountRepository : public ports::output::IAccountRepository {
public:
    PostgresAccountRepository(pqxx::work& txn, bool rowLocking)
        : txn_(txn), rowLocking_(rowLocking) {}

    std::optional<domain::Account> getByNumber(const domain::AccountNumber& number) override {
        auto result = txn_.exec_params(
            "SELECT account_id, account_number, balance_cents, currency, version "
            "FROM accounts WHERE account_number = $1",
            number.value()
        );

        if (result.empty()) {
            return std::nullopt;
        }
        return rowToAccount(result[0]);
    }

    domain::Result<std::optional<domain::Account>> getByNumberForUpdate(
        const domain::AccountNumber& number) override
    {
        using Locked = domain::Result<std::optional<domain::Account>>;

        if (!rowLocking_) {
            return Locked::success(getByNumber(number));
        }

        try {
            auto result = txn_.exec_params(
                "SELECT account_id, account_number, balance_cents, currency, version "
                "FROM accounts WHERE account_number = $1 FOR UPDATE",
                number.value()
            );

            if (result.empty()) {
                return Locked::success(std::nullopt);
            }
            return Locked::success(rowToAccount(result[0]));

        } catch (const pqxx::sql_error& e) {
            if (!isConcurrencySqlState(e.sqlstate())) {
                std::cerr << "[PostgresAccountRepository] getByNumberForUpdate error: " << e.what() << std::endl;
                throw;
            }
            std::cerr << "[PostgresAccountRepository] Lock conflict on " << number.value()
                      << " (SQLSTATE " << e.sqlstate() << ")" << std::endl;
            return Locked::failure(domain::ErrorKind::CONCURRENCY_CONFLICT,
                "Account " + number.value() + " is locked by another transaction");
        }
    }

    domain::Result<domain::Account> save(const domain::Account& account) override {
        using Saved = domain::Result<domain::Account>;

        try {
            if (account.isNew()) {
                txn_.exec_params(
                    "INSERT INTO accounts (account_id, account_number, balance_cents, currency, version) "
                    "VALUES ($1, $2, $3, $4, 1)",
                    account.accountId().value(),
                    account.accountNumber().value(),
                    account.balance().amountCents(),
                    account.balance().currency()
                );
                return Saved::success(account.withVersion(1));
            }

            auto result = txn_.exec_params(
                "UPDATE accounts SET balance_cents = $1, version = version + 1 "
                "WHERE account_id = $2 AND version = $3",
                account.balance().amountCents(),
                account.accountId().value(),
                account.version()
            );

            if (result.affected_rows() == 0) {
                return Saved::failure(domain::ErrorKind::CONCURRENCY_CONFLICT,
                    "Account " + account.accountNumber().value() + " was modified concurrently"
                    " (expected version " + std::to_string(account.version()) + ")");
            }
            return Saved::success(account.withVersion(account.version() + 1));

        } catch (const pqxx::sql_error& e) {
            if (isUniqueViolation(e.sqlstate())) {
                return Saved::failure(domain::ErrorKind::ACCOUNT_ALREADY_EXISTS,
                    "Account " + account.accountNumber().value() + " already exists");
            }
            if (isConcurrencySqlState(e.sqlstate())) {
                return Saved::failure(domain::ErrorKind::CONCURRENCY_CONFLICT,
                    "Concurrent update of account " + account.accountNumber().value()
                    + " (SQLSTATE " + e.sqlstate() + ")");
            }
            std::cerr << "[PostgresAccountRepository] save error: " << e.what() << std::endl;
            throw;
        }
    }

private:
    pqxx::work& txn_;
    bool rowLocking_;

    static domain::Account rowToAccount(const pqxx::row& row) {
        auto number = domain::AccountNumber::parse(row["account_number"].as<std::string>());
        if (!number) {
            throw std::runtime_error("Corrupt account row: " + number.error().message);
        }

        auto balance = domain::Money::of(row["balance_cents"].as<int64_t>(),
                                         row["currency"].as<std::string>());
        if (!balance) {
            throw std::runtime_error("Corrupt account row: " + balance.error().message);
        }

        return domain::Account::restore(
            domain::AccountId::of(row["account_id"].as<std::string>()),
            number.value(),
            balance.value(),
            row["version"].as<int64_t>()
        );
    }
};

} // namespace bank::adapters::secondary
