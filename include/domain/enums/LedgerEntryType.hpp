#pragma once

#include <string>
#include <optional>

namespace bank::domain {

enum class LedgerEntryType {
    DEPOSIT,
    WITHDRAWAL,
    TRANSFER_IN,
    TRANSFER_OUT
};

inline std::string toString(LedgerEntryType type) {
    switch (type) {
        case LedgerEntryType::DEPOSIT: return "DEPOSIT";
        case LedgerEntryType::WITHDRAWAL: return "WITHDRAWAL";
        case LedgerEntryType::TRANSFER_IN: return "TRANSFER_IN";
        case LedgerEntryType::TRANSFER_OUT: return "TRANSFER_OUT";
        default: return "UNKNOWN";
    }
}

inline std::optional<LedgerEntryType> parseLedgerEntryType(const std::string& str) {
    if (str == "DEPOSIT") return LedgerEntryType::DEPOSIT;
    if (str == "WITHDRAWAL") return LedgerEntryType::WITHDRAWAL;
    if (str == "TRANSFER_IN") return LedgerEntryType::TRANSFER_IN;
    if (str == "TRANSFER_OUT") return LedgerEntryType::TRANSFER_OUT;
    return std::nullopt;
}

} // namespace bank::domain
