// include/adapters/secondary/PostgresErrors.hpp
#pragma once

#include <string>

namespace bank::adapters::secondary {

/**
 * @brief SQLSTATE, означающие конкурентный конфликт
 *
 * - 40001 serialization_failure
 * - 40P01 deadlock_detected
 * - 55P03 lock_not_available (сработал lock_timeout / NOWAIT)
 */
inline bool isConcurrencySqlState(const std::string& sqlstate) {
    return sqlstate == "40001" || sqlstate == "40P01" || sqlstate == "55P03";
}

/// 23505 unique_violation
inline bool isUniqueViolation(const std::string& sqlstate) {
    return sqlstate == "23505";
}

} // namespace bank::adapters::secondary
