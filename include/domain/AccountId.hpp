// include/domain/AccountId.hpp
#pragma once

#include "utils/UuidGenerator.hpp"
#include <string>
#include <functional>

namespace bank::domain {

/**
 * @brief Внутренний идентификатор счёта (UUID)
 *
 * Генерируется при открытии счёта и никогда не переиспользуется.
 * По нему проводки привязываются к счёту.
 */
class AccountId {
public:
    static AccountId generate() {
        return AccountId(utils::UuidGenerator::generate());
    }

    /// Восстановление из хранилища
    static AccountId of(const std::string& value) {
        return AccountId(value);
    }

    const std::string& value() const { return value_; }

    bool operator==(const AccountId& other) const { return value_ == other.value_; }
    bool operator!=(const AccountId& other) const { return value_ != other.value_; }

private:
    explicit AccountId(std::string value) : value_(std::move(value)) {}

    std::string value_;
};

} // namespace bank::domain

namespace std {

template <>
struct hash<bank::domain::AccountId> {
    size_t operator()(const bank::domain::AccountId& id) const noexcept {
        return hash<string>{}(id.value());
    }
};

} // namespace std
