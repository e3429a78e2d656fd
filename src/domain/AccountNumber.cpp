#include "domain/AccountNumber.hpp"
#include <cctype>

namespace bank::domain {

Result<AccountNumber> AccountNumber::parse(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;

    std::string normalized = text.substr(begin, end - begin);

    if (normalized.empty()) {
        return Result<AccountNumber>::failure(ErrorKind::INVALID_ACCOUNT_NUMBER,
            "AccountNumber must not be empty");
    }

    for (char c : normalized) {
        // std::isdigit зависит от локали, проверяем ASCII явно
        if (c < '0' || c > '9') {
            return Result<AccountNumber>::failure(ErrorKind::INVALID_ACCOUNT_NUMBER,
                "AccountNumber must contain only digits");
        }
    }

    if (normalized.size() < MIN_LENGTH || normalized.size() > MAX_LENGTH) {
        return Result<AccountNumber>::failure(ErrorKind::INVALID_ACCOUNT_NUMBER,
            "AccountNumber must be between 6 and 12 digits long");
    }

    return Result<AccountNumber>::success(AccountNumber(std::move(normalized)));
}

} // namespace bank::domain
