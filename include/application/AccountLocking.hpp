// include/application/AccountLocking.hpp
#pragma once

#include "ports/output/IAccountRepository.hpp"
#include "domain/Account.hpp"
#include "domain/AccountNumber.hpp"
#include "domain/Result.hpp"
#include <algorithm>
#include <string>
#include <vector>

namespace bank::application {

/**
 * @brief Захватить блокировки на несколько счетов в порядке возрастания номера
 *
 * Единственное правило порядка, от которого зависит корректность:
 * два встречных перевода A→B и B→A запрашивают блокировки в одном и том же
 * глобальном порядке, поэтому циклического ожидания не возникает.
 * Любой код, блокирующий больше одного счёта, обязан идти через эту функцию.
 *
 * Дубликаты номеров схлопываются.
 *
 * @return Счета в порядке возрастания номера;
 *         CONCURRENCY_CONFLICT - от хранилища при занятой строке;
 *         ACCOUNT_NOT_FOUND - если хотя бы одного счёта нет
 */
inline domain::Result<std::vector<domain::Account>> lockInAscendingOrder(
    ports::output::IAccountRepository& accounts,
    std::vector<domain::AccountNumber> numbers)
{
    using LockedAccounts = domain::Result<std::vector<domain::Account>>;

    std::sort(numbers.begin(), numbers.end());
    numbers.erase(std::unique(numbers.begin(), numbers.end()), numbers.end());

    std::vector<domain::Account> locked;
    std::string missing;

    for (const auto& number : numbers) {
        auto found = accounts.getByNumberForUpdate(number);
        if (!found) {
            return LockedAccounts::failure(found.error());
        }
        if (!found.value()) {
            missing += missing.empty() ? number.value() : ", " + number.value();
            continue;
        }
        locked.push_back(*found.value());
    }

    if (!missing.empty()) {
        return LockedAccounts::failure(domain::ErrorKind::ACCOUNT_NOT_FOUND,
            "Account(s) not found: " + missing);
    }

    return LockedAccounts::success(std::move(locked));
}

} // namespace bank::application
