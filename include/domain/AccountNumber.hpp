// include/domain/AccountNumber.hpp
#pragma once

#include "Result.hpp"
#include <string>

namespace bank::domain {

/**
 * @brief Внешний (бизнес) номер счёта
 *
 * 6-12 ASCII-цифр. Пробелы по краям отбрасываются, внутри - запрещены.
 * Лексикографический порядок номеров задаёт глобальный порядок
 * захвата блокировок при операциях над несколькими счетами.
 */
class AccountNumber {
public:
    static constexpr size_t MIN_LENGTH = 6;
    static constexpr size_t MAX_LENGTH = 12;

    static Result<AccountNumber> parse(const std::string& text);

    const std::string& value() const { return value_; }

    bool operator==(const AccountNumber& other) const { return value_ == other.value_; }
    bool operator!=(const AccountNumber& other) const { return value_ != other.value_; }
    bool operator<(const AccountNumber& other) const { return value_ < other.value_; }

private:
    explicit AccountNumber(std::string value) : value_(std::move(value)) {}

    std::string value_;
};

} // namespace bank::domain
