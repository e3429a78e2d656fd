#include "domain/Money.hpp"
#include <limits>
#include <cctype>

namespace bank::domain {

std::string Money::normalizeCurrency(const std::string& currency) {
    size_t begin = 0;
    size_t end = currency.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(currency[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(currency[end - 1]))) --end;

    if (end - begin != 3) {
        return "";
    }

    std::string code;
    for (size_t i = begin; i < end; ++i) {
        unsigned char c = static_cast<unsigned char>(currency[i]);
        if (c > 0x7F || !std::isalpha(c)) {
            return "";
        }
        code.push_back(static_cast<char>(std::toupper(c)));
    }
    return code;
}

Result<Money> Money::of(int64_t amountCents, const std::string& currency) {
    if (amountCents < 0) {
        return Result<Money>::failure(ErrorKind::INVALID_AMOUNT,
            "Money amount cannot be negative: " + std::to_string(amountCents));
    }

    std::string code = normalizeCurrency(currency);
    if (code.empty()) {
        return Result<Money>::failure(ErrorKind::INVALID_CURRENCY,
            "Currency must be a 3-letter code, got '" + currency + "'");
    }

    return Result<Money>::success(Money(amountCents, code));
}

Result<Money> Money::zero(const std::string& currency) {
    return of(0, currency);
}

Status Money::ensureSameCurrency(const Money& other) const {
    if (currency_ != other.currency_) {
        return Status::failure(ErrorKind::CURRENCY_MISMATCH,
            "Money currency mismatch: " + currency_ + " vs " + other.currency_);
    }
    return Status::success();
}

Result<Money> Money::add(const Money& other) const {
    auto same = ensureSameCurrency(other);
    if (!same) {
        return Result<Money>::failure(same.error());
    }

    if (other.amountCents_ > std::numeric_limits<int64_t>::max() - amountCents_) {
        return Result<Money>::failure(ErrorKind::INVALID_AMOUNT, "Money amount overflow");
    }

    return Result<Money>::success(Money(amountCents_ + other.amountCents_, currency_));
}

Result<Money> Money::subtract(const Money& other) const {
    auto same = ensureSameCurrency(other);
    if (!same) {
        return Result<Money>::failure(same.error());
    }

    if (other.amountCents_ > amountCents_) {
        return Result<Money>::failure(ErrorKind::NEGATIVE_RESULT,
            "Resulting Money amount cannot be negative");
    }

    return Result<Money>::success(Money(amountCents_ - other.amountCents_, currency_));
}

Result<int> Money::compare(const Money& other) const {
    auto same = ensureSameCurrency(other);
    if (!same) {
        return Result<int>::failure(same.error());
    }

    if (amountCents_ < other.amountCents_) return Result<int>::success(-1);
    if (amountCents_ > other.amountCents_) return Result<int>::success(1);
    return Result<int>::success(0);
}

Result<bool> Money::lessThan(const Money& other) const {
    auto cmp = compare(other);
    if (!cmp) return Result<bool>::failure(cmp.error());
    return Result<bool>::success(cmp.value() < 0);
}

Result<bool> Money::lessOrEqual(const Money& other) const {
    auto cmp = compare(other);
    if (!cmp) return Result<bool>::failure(cmp.error());
    return Result<bool>::success(cmp.value() <= 0);
}

Result<bool> Money::greaterThan(const Money& other) const {
    auto cmp = compare(other);
    if (!cmp) return Result<bool>::failure(cmp.error());
    return Result<bool>::success(cmp.value() > 0);
}

Result<bool> Money::greaterOrEqual(const Money& other) const {
    auto cmp = compare(other);
    if (!cmp) return Result<bool>::failure(cmp.error());
    return Result<bool>::success(cmp.value() >= 0);
}

std::string Money::toString() const {
    return std::to_string(amountCents_) + " " + currency_;
}

} // namespace bank::domain
