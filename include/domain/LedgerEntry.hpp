// include/domain/LedgerEntry.hpp
#pragma once

#include "AccountId.hpp"
#include "AccountNumber.hpp"
#include "Money.hpp"
#include "Result.hpp"
#include "Timestamp.hpp"
#include "enums/LedgerEntryType.hpp"
#include "utils/UuidGenerator.hpp"
#include <optional>
#include <string>

namespace bank::domain {

/**
 * @brief Проводка: неизменяемый факт изменения баланса одного счёта
 *
 * Журнал только дописывается: проводки не обновляются и не удаляются.
 * - DEPOSIT / WITHDRAWAL: одна проводка на операцию
 * - TRANSFER_OUT + TRANSFER_IN: две проводки на перевод с общим
 *   correlationId, каждая ссылается на номер счёта контрагента
 */
class LedgerEntry {
public:
    /**
     * @brief Создать новую проводку
     *
     * @param occurredAt по умолчанию - текущее время
     * @return INVALID_AMOUNT для нулевой суммы
     */
    static Result<LedgerEntry> create(const AccountId& accountId,
                                      LedgerEntryType type,
                                      const Money& amount,
                                      std::optional<std::string> correlationId = std::nullopt,
                                      std::optional<AccountNumber> counterparty = std::nullopt,
                                      std::optional<Timestamp> occurredAt = std::nullopt) {
        if (amount.isZero()) {
            return Result<LedgerEntry>::failure(ErrorKind::INVALID_AMOUNT,
                "Ledger entry amount must be greater than zero");
        }
        return Result<LedgerEntry>::success(LedgerEntry(utils::UuidGenerator::generate(),
                                                        accountId,
                                                        type,
                                                        amount,
                                                        std::move(correlationId),
                                                        std::move(counterparty),
                                                        occurredAt.value_or(Timestamp::now())));
    }

    /**
     * @brief Восстановить проводку из хранилища
     */
    static LedgerEntry restore(const std::string& entryId,
                               const AccountId& accountId,
                               LedgerEntryType type,
                               const Money& amount,
                               std::optional<std::string> correlationId,
                               std::optional<AccountNumber> counterparty,
                               const Timestamp& occurredAt) {
        return LedgerEntry(entryId, accountId, type, amount,
                           std::move(correlationId), std::move(counterparty), occurredAt);
    }

    const std::string& entryId() const { return entryId_; }
    const AccountId& accountId() const { return accountId_; }
    LedgerEntryType type() const { return type_; }
    const Money& amount() const { return amount_; }
    const std::optional<std::string>& correlationId() const { return correlationId_; }
    const std::optional<AccountNumber>& counterpartyAccountNumber() const { return counterparty_; }
    const Timestamp& occurredAt() const { return occurredAt_; }

private:
    LedgerEntry(std::string entryId,
                AccountId accountId,
                LedgerEntryType type,
                Money amount,
                std::optional<std::string> correlationId,
                std::optional<AccountNumber> counterparty,
                Timestamp occurredAt)
        : entryId_(std::move(entryId))
        , accountId_(std::move(accountId))
        , type_(type)
        , amount_(std::move(amount))
        , correlationId_(std::move(correlationId))
        , counterparty_(std::move(counterparty))
        , occurredAt_(occurredAt) {}

    std::string entryId_;
    AccountId accountId_;
    LedgerEntryType type_;
    Money amount_;
    std::optional<std::string> correlationId_;
    std::optional<AccountNumber> counterparty_;
    Timestamp occurredAt_;
};

} // namespace bank::domain
