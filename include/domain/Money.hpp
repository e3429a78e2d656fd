// include/domain/Money.hpp
#pragma once

#include "Result.hpp"
#include <string>
#include <cstdint>

namespace bank::domain {

/**
 * @brief Денежная сумма с валютой
 *
 * Хранит значение в минорных единицах (центы, копейки) как int64_t.
 * Инварианты:
 * - amountCents >= 0 всегда
 * - валюта: три латинские буквы в верхнем регистре (ISO 4217)
 *
 * Значение неизменяемо: add/subtract возвращают новый Money.
 * Все бинарные операции требуют одинаковой валюты (иначе CURRENCY_MISMATCH).
 */
class Money {
public:
    static constexpr const char* DEFAULT_CURRENCY = "BRL";

    /**
     * @brief Создать сумму с валидацией
     * @param amountCents Сумма в минорных единицах (отрицательная → INVALID_AMOUNT)
     * @param currency Код валюты (не 3 буквы → INVALID_CURRENCY)
     */
    static Result<Money> of(int64_t amountCents, const std::string& currency = DEFAULT_CURRENCY);

    /**
     * @brief Нулевая сумма в заданной валюте
     */
    static Result<Money> zero(const std::string& currency = DEFAULT_CURRENCY);

    int64_t amountCents() const { return amountCents_; }
    const std::string& currency() const { return currency_; }

    bool isZero() const { return amountCents_ == 0; }

    Result<Money> add(const Money& other) const;

    /**
     * @brief Вычитание; результат < 0 → NEGATIVE_RESULT
     */
    Result<Money> subtract(const Money& other) const;

    /**
     * @brief Сравнение: -1, 0, 1
     */
    Result<int> compare(const Money& other) const;

    Result<bool> lessThan(const Money& other) const;
    Result<bool> lessOrEqual(const Money& other) const;
    Result<bool> greaterThan(const Money& other) const;
    Result<bool> greaterOrEqual(const Money& other) const;

    bool operator==(const Money& other) const {
        return amountCents_ == other.amountCents_ && currency_ == other.currency_;
    }

    bool operator!=(const Money& other) const {
        return !(*this == other);
    }

    std::string toString() const;

    /**
     * @brief Нормализовать код валюты
     * @return Код в верхнем регистре или пустая строка, если код некорректен
     */
    static std::string normalizeCurrency(const std::string& currency);

private:
    Money(int64_t amountCents, std::string currency)
        : amountCents_(amountCents), currency_(std::move(currency)) {}

    Status ensureSameCurrency(const Money& other) const;

    int64_t amountCents_ = 0;
    std::string currency_;
};

} // namespace bank::domain
