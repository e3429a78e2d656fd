#pragma once

#include "domain/LedgerEntry.hpp"
#include "domain/AccountId.hpp"
#include <vector>

namespace bank::ports::output {

/**
 * @brief Журнал проводок (append-only), привязанный к транзакции
 */
class ILedgerRepository {
public:
    virtual ~ILedgerRepository() = default;

    virtual void save(const domain::LedgerEntry& entry) = 0;

    /**
     * @brief Все проводки счёта в порядке записи
     */
    virtual std::vector<domain::LedgerEntry> listByAccount(const domain::AccountId& accountId) = 0;
};

} // namespace bank::ports::output
