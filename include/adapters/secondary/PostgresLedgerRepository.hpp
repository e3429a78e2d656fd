// include/adapters/secondary/PostgresLedgerRepository.hpp
#pragma once

#include "ports/output/ILedgerRepository.hpp"
#include <pqxx/pqxx>
#include <optional>
#include <stdexcept>

namespace bank::adapters::secondary {

/**
 * @brief PostgreSQL журнал проводок в рамках одной pqxx::work
 *
 * Таблица: ledger_entries
 * - seq BIGSERIAL (порядок записи)
 * - entry_id VARCHAR(36) PRIMARY KEY
 * - account_id → accounts (DEFERRABLE: проверяется при COMMIT)
 * - entry_type, amount_cents > 0, currency
 * - correlation_id, counterparty_account_number - NULL для DEPOSIT/WITHDRAWAL
 * - occurred_at TIMESTAMPTZ
 */
class PostgresLedgerRepository : public ports::output::ILedgerRepository {
public:
    explicit PostgresLedgerRepository(pqxx::work& txn) : txn_(txn) {}

    void save(const domain::LedgerEntry& entry) override {
        std::optional<std::string> counterparty;
        if (entry.counterpartyAccountNumber()) {
            counterparty = entry.counterpartyAccountNumber()->value();
        }

        txn_.exec_params(
            "INSERT INTO ledger_entries "
            "(entry_id, account_id, entry_type, amount_cents, currency, "
            " correlation_id, counterparty_account_number, occurred_at) "
            "VALUES ($1, $2, $3, $4, $5, $6, $7, "
            "        TIMESTAMPTZ 'epoch' + $8 * INTERVAL '1 microsecond')",
            entry.entryId(),
            entry.accountId().value(),
            domain::toString(entry.type()),
            entry.amount().amountCents(),
            entry.amount().currency(),
            entry.correlationId(),
            counterparty,
            entry.occurredAt().toMicros()
        );
    }

    std::vector<domain::LedgerEntry> listByAccount(const domain::AccountId& accountId) override {
        auto result = txn_.exec_params(
            "SELECT entry_id, account_id, entry_type, amount_cents, currency, "
            "       correlation_id, counterparty_account_number, "
            "       (EXTRACT(EPOCH FROM occurred_at) * 1000000)::BIGINT AS occurred_at_us "
            "FROM ledger_entries WHERE account_id = $1 ORDER BY seq",
            accountId.value()
        );

        std::vector<domain::LedgerEntry> entries;
        entries.reserve(result.size());
        for (const auto& row : result) {
            entries.push_back(rowToEntry(row));
        }
        return entries;
    }

private:
    pqxx::work& txn_;

    static domain::LedgerEntry rowToEntry(const pqxx::row& row) {
        auto type = domain::parseLedgerEntryType(row["entry_type"].as<std::string>());
        if (!type) {
            throw std::runtime_error("Unknown entry_type: " + row["entry_type"].as<std::string>());
        }

        auto amount = domain::Money::of(row["amount_cents"].as<int64_t>(),
                                        row["currency"].as<std::string>());
        if (!amount) {
            throw std::runtime_error("Corrupt ledger row: " + amount.error().message);
        }

        std::optional<std::string> correlationId;
        if (!row["correlation_id"].is_null()) {
            correlationId = row["correlation_id"].as<std::string>();
        }

        std::optional<domain::AccountNumber> counterparty;
        if (!row["counterparty_account_number"].is_null()) {
            auto parsed = domain::AccountNumber::parse(row["counterparty_account_number"].as<std::string>());
            if (!parsed) {
                throw std::runtime_error("Corrupt ledger row: " + parsed.error().message);
            }
            counterparty = parsed.value();
        }

        return domain::LedgerEntry::restore(
            row["entry_id"].as<std::string>(),
            domain::AccountId::of(row["account_id"].as<std::string>()),
            *type,
            amount.value(),
            std::move(correlationId),
            std::move(counterparty),
            domain::Timestamp::fromMicros(row["occurred_at_us"].as<int64_t>())
        );
    }
};

} // namespace bank::adapters::secondary
