// include/domain/Account.hpp
#pragma once

#include "AccountId.hpp"
#include "AccountNumber.hpp"
#include "Money.hpp"
#include "Result.hpp"
#include <string>
#include <cstdint>

namespace bank::domain {

/**
 * @brief Банковский счёт (aggregate root)
 *
 * Инварианты:
 * - balance >= 0 всегда
 * - accountNumber глобально уникален
 * - version растёт ровно на 1 при каждом сохранении изменений
 *   (оптимистичная проверка конфликтов)
 *
 * deposit/withdraw меняют только объект в памяти; сохранение -
 * отдельный шаг сервиса внутри транзакции. При ошибке объект не меняется.
 *
 * @example
 * ```cpp
 * auto account = Account::open(number, "BRL").value();
 * account.deposit(Money::of(10000, "BRL").value());   // balance=10000
 * account.withdraw(Money::of(2000, "BRL").value());   // balance=8000
 * ```
 */
class Account {
public:
    /**
     * @brief Открыть новый счёт с нулевым балансом
     *
     * version = 0: счёт ещё не сохранён, хранилище запишет version = 1.
     */
    static Result<Account> open(const AccountNumber& number,
                                const std::string& currency = Money::DEFAULT_CURRENCY);

    /**
     * @brief Восстановить счёт из хранилища
     */
    static Account restore(const AccountId& id,
                           const AccountNumber& number,
                           const Money& balance,
                           int64_t version);

    /**
     * @brief Зачислить сумму
     *
     * @return INVALID_AMOUNT для нулевой суммы, CURRENCY_MISMATCH для чужой валюты
     */
    Status deposit(const Money& amount);

    /**
     * @brief Списать сумму
     *
     * @return INVALID_AMOUNT для нулевой суммы, INSUFFICIENT_FUNDS если amount > balance,
     *         CURRENCY_MISMATCH для чужой валюты
     */
    Status withdraw(const Money& amount);

    const AccountId& accountId() const { return accountId_; }
    const AccountNumber& accountNumber() const { return accountNumber_; }
    const Money& balance() const { return balance_; }
    int64_t version() const { return version_; }

    bool isNew() const { return version_ == 0; }

    /// Вызывается хранилищем после успешной записи
    Account withVersion(int64_t version) const {
        Account copy(*this);
        copy.version_ = version;
        return copy;
    }

private:
    Account(AccountId id, AccountNumber number, Money balance, int64_t version)
        : accountId_(std::move(id))
        , accountNumber_(std::move(number))
        , balance_(std::move(balance))
        , version_(version) {}

    AccountId accountId_;
    AccountNumber accountNumber_;
    Money balance_;
    int64_t version_ = 0;
};

} // namespace bank::domain
