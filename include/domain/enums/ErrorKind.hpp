// include/domain/enums/ErrorKind.hpp
#pragma once

#include <string>

namespace bank::domain {

/**
 * @brief Вид ошибки операции
 *
 * Три группы:
 * - валидация (до любого обращения к хранилищу, не ретраится)
 * - бизнес-правила (хранилище не меняется, не ретраится)
 * - конфликт конкурентного доступа (ретраится всей транзакцией)
 */
enum class ErrorKind {
    INVALID_ACCOUNT_NUMBER,
    INVALID_AMOUNT,
    INVALID_CURRENCY,
    CURRENCY_MISMATCH,
    NEGATIVE_RESULT,
    SAME_ACCOUNT_TRANSFER,
    ACCOUNT_NOT_FOUND,
    ACCOUNT_ALREADY_EXISTS,
    INSUFFICIENT_FUNDS,
    CONCURRENCY_CONFLICT
};

inline std::string toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::INVALID_ACCOUNT_NUMBER: return "INVALID_ACCOUNT_NUMBER";
        case ErrorKind::INVALID_AMOUNT: return "INVALID_AMOUNT";
        case ErrorKind::INVALID_CURRENCY: return "INVALID_CURRENCY";
        case ErrorKind::CURRENCY_MISMATCH: return "CURRENCY_MISMATCH";
        case ErrorKind::NEGATIVE_RESULT: return "NEGATIVE_RESULT";
        case ErrorKind::SAME_ACCOUNT_TRANSFER: return "SAME_ACCOUNT_TRANSFER";
        case ErrorKind::ACCOUNT_NOT_FOUND: return "ACCOUNT_NOT_FOUND";
        case ErrorKind::ACCOUNT_ALREADY_EXISTS: return "ACCOUNT_ALREADY_EXISTS";
        case ErrorKind::INSUFFICIENT_FUNDS: return "INSUFFICIENT_FUNDS";
        case ErrorKind::CONCURRENCY_CONFLICT: return "CONCURRENCY_CONFLICT";
        default: return "UNKNOWN";
    }
}

inline bool isValidationError(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::INVALID_ACCOUNT_NUMBER:
        case ErrorKind::INVALID_AMOUNT:
        case ErrorKind::INVALID_CURRENCY:
        case ErrorKind::CURRENCY_MISMATCH:
        case ErrorKind::NEGATIVE_RESULT:
        case ErrorKind::SAME_ACCOUNT_TRANSFER:
            return true;
        default:
            return false;
    }
}

inline bool isBusinessError(ErrorKind kind) {
    return kind == ErrorKind::ACCOUNT_NOT_FOUND
        || kind == ErrorKind::ACCOUNT_ALREADY_EXISTS
        || kind == ErrorKind::INSUFFICIENT_FUNDS;
}

inline bool isConcurrencyError(ErrorKind kind) {
    return kind == ErrorKind::CONCURRENCY_CONFLICT;
}

} // namespace bank::domain
