// include/adapters/secondary/InMemoryBankStore.hpp
#pragma once

#include "domain/Account.hpp"
#include "domain/AccountId.hpp"
#include "domain/AccountNumber.hpp"
#include "domain/LedgerEntry.hpp"
#include "domain/Result.hpp"
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace bank::adapters::secondary {

/**
 * @brief Запись счёта, накопленная транзакцией до commit
 *
 * expectedVersion - версия, прочитанная транзакцией (0 для нового счёта).
 */
struct PendingAccountWrite {
    domain::Account account;
    int64_t expectedVersion = 0;
};

/**
 * @brief Буфер одной транзакции: общий для её репозиториев
 */
struct InMemoryTransaction {
    uint64_t id = 0;
    std::vector<PendingAccountWrite> accountWrites;
    std::vector<domain::LedgerEntry> ledgerWrites;
};

/**
 * @brief Общее in-memory хранилище счетов и журнала
 *
 * Хранит зафиксированное состояние и строковые блокировки.
 * Незафиксированные изменения живут в InMemoryUnitOfWork и попадают
 * сюда только через commit() - атомарно, после проверки версий.
 *
 * Блокировки:
 * - PESSIMISTIC: lockByNumber() держит эксклюзивную блокировку номера счёта
 *   за транзакцией до release(); ожидание ограничено lockTimeout,
 *   по таймауту - CONCURRENCY_CONFLICT. Повторный захват своей же
 *   транзакцией не блокирует.
 * - OPTIMISTIC_ONLY: блокировок нет, lockByNumber() - простое чтение,
 *   конфликты ловит проверка version при commit().
 */
class InMemoryBankStore {
public:
    enum class LockingMode {
        PESSIMISTIC,
        OPTIMISTIC_ONLY
    };

    static constexpr std::chrono::milliseconds DEFAULT_LOCK_TIMEOUT{2000};

    explicit InMemoryBankStore(LockingMode mode = LockingMode::PESSIMISTIC,
                               std::chrono::milliseconds lockTimeout = DEFAULT_LOCK_TIMEOUT)
        : mode_(mode)
        , lockTimeout_(lockTimeout)
    {
        std::cout << "[InMemoryBankStore] Created (mode="
                  << (mode_ == LockingMode::PESSIMISTIC ? "pessimistic" : "optimistic")
                  << ", lockTimeout=" << lockTimeout_.count() << "ms)" << std::endl;
    }

    LockingMode lockingMode() const { return mode_; }

    uint64_t beginTransaction() {
        std::lock_guard<std::mutex> lock(locksMutex_);
        return ++lastTransactionId_;
    }

    // ================================================================
    // Чтение зафиксированного состояния
    // ================================================================

    std::optional<domain::Account> findByNumber(const domain::AccountNumber& number) const {
        std::shared_lock<std::shared_mutex> lock(dataMutex_);
        auto idIt = idsByNumber_.find(number.value());
        if (idIt == idsByNumber_.end()) {
            return std::nullopt;
        }
        return accounts_.at(idIt->second);
    }

    std::optional<int64_t> committedVersion(const domain::AccountId& id) const {
        std::shared_lock<std::shared_mutex> lock(dataMutex_);
        auto it = accounts_.find(id.value());
        if (it == accounts_.end()) {
            return std::nullopt;
        }
        return it->second.version();
    }

    bool numberTaken(const domain::AccountNumber& number) const {
        std::shared_lock<std::shared_mutex> lock(dataMutex_);
        return idsByNumber_.count(number.value()) > 0;
    }

    std::vector<domain::LedgerEntry> ledgerFor(const domain::AccountId& id) const {
        std::shared_lock<std::shared_mutex> lock(dataMutex_);
        std::vector<domain::LedgerEntry> result;
        for (const auto& entry : ledger_) {
            if (entry.accountId() == id) {
                result.push_back(entry);
            }
        }
        return result;
    }

    // ================================================================
    // Блокировки
    // ================================================================

    /**
     * @brief Чтение с эксклюзивной блокировкой номера счёта
     *
     * @return CONCURRENCY_CONFLICT если блокировка не получена за lockTimeout
     *         (или сработал инжектированный конфликт)
     */
    domain::Result<std::optional<domain::Account>> lockByNumber(
        uint64_t transactionId, const domain::AccountNumber& number)
    {
        using Locked = domain::Result<std::optional<domain::Account>>;

        {
            std::unique_lock<std::mutex> lock(locksMutex_);

            if (injectedLockConflicts_ > 0) {
                --injectedLockConflicts_;
                return Locked::failure(domain::ErrorKind::CONCURRENCY_CONFLICT,
                    "Injected lock conflict on account " + number.value());
            }

            if (mode_ == LockingMode::PESSIMISTIC) {
                const bool acquired = lockReleased_.wait_for(lock, lockTimeout_, [&] {
                    auto it = rowLocks_.find(number.value());
                    return it == rowLocks_.end() || it->second == transactionId;
                });
                if (!acquired) {
                    std::cerr << "[InMemoryBankStore] Lock wait timeout on account "
                              << number.value() << " (tx " << transactionId << ")" << std::endl;
                    return Locked::failure(domain::ErrorKind::CONCURRENCY_CONFLICT,
                        "Lock wait timeout on account " + number.value());
                }
                rowLocks_[number.value()] = transactionId;
            }
        }

        return Locked::success(findByNumber(number));
    }

    /**
     * @brief Снять все блокировки транзакции
     *
     * @param committed false - транзакция откачена (учитывается в rollbackCount)
     */
    void release(uint64_t transactionId, bool committed) {
        {
            std::lock_guard<std::mutex> lock(locksMutex_);
            for (auto it = rowLocks_.begin(); it != rowLocks_.end();) {
                if (it->second == transactionId) {
                    it = rowLocks_.erase(it);
                } else {
                    ++it;
                }
            }
            if (!committed) {
                ++rollbacks_;
            }
        }
        lockReleased_.notify_all();
    }

    // ================================================================
    // Фиксация
    // ================================================================

    /**
     * @brief Атомарно применить изменения транзакции
     *
     * Сначала проверяются все записи, затем применяются все сразу:
     * при любой ошибке хранилище не меняется.
     *
     * @return CONCURRENCY_CONFLICT - version в хранилище не совпала с прочитанной;
     *         ACCOUNT_ALREADY_EXISTS - номер нового счёта уже занят
     * @throws std::runtime_error проводка ссылается на несуществующий счёт
     */
    domain::Status commit(const std::vector<PendingAccountWrite>& accountWrites,
                          const std::vector<domain::LedgerEntry>& ledgerWrites)
    {
        {
            std::lock_guard<std::mutex> lock(locksMutex_);
            if (injectedCommitConflicts_ > 0) {
                --injectedCommitConflicts_;
                return domain::Status::failure(domain::ErrorKind::CONCURRENCY_CONFLICT,
                    "Injected commit conflict");
            }
        }

        std::unique_lock<std::shared_mutex> lock(dataMutex_);

        for (const auto& write : accountWrites) {
            const auto& account = write.account;
            auto it = accounts_.find(account.accountId().value());

            if (write.expectedVersion == 0) {
                if (idsByNumber_.count(account.accountNumber().value()) > 0) {
                    return domain::Status::failure(domain::ErrorKind::ACCOUNT_ALREADY_EXISTS,
                        "Account " + account.accountNumber().value() + " already exists");
                }
                if (it != accounts_.end()) {
                    return domain::Status::failure(domain::ErrorKind::CONCURRENCY_CONFLICT,
                        "Account id " + account.accountId().value() + " was inserted concurrently");
                }
                continue;
            }

            if (it == accounts_.end() || it->second.version() != write.expectedVersion) {
                return domain::Status::failure(domain::ErrorKind::CONCURRENCY_CONFLICT,
                    "Account " + account.accountNumber().value()
                    + " was modified concurrently (expected version "
                    + std::to_string(write.expectedVersion) + ")");
            }
        }

        for (const auto& entry : ledgerWrites) {
            const bool known = accounts_.count(entry.accountId().value()) > 0
                || std::any_of(accountWrites.begin(), accountWrites.end(),
                       [&](const PendingAccountWrite& w) {
                           return w.account.accountId() == entry.accountId();
                       });
            if (!known) {
                throw std::runtime_error("Ledger entry " + entry.entryId()
                    + " references unknown account " + entry.accountId().value());
            }
        }

        for (const auto& write : accountWrites) {
            const auto& account = write.account;
            accounts_.insert_or_assign(account.accountId().value(), account);
            idsByNumber_[account.accountNumber().value()] = account.accountId().value();
        }
        ledger_.insert(ledger_.end(), ledgerWrites.begin(), ledgerWrites.end());

        ++commits_;
        return domain::Status::success();
    }

    // ================================================================
    // Хуки для тестов
    // ================================================================

    /// Следующие n вызовов lockByNumber() вернут CONCURRENCY_CONFLICT
    void injectLockConflicts(int n) {
        std::lock_guard<std::mutex> lock(locksMutex_);
        injectedLockConflicts_ = n;
    }

    /// Следующие n вызовов commit() вернут CONCURRENCY_CONFLICT
    void injectCommitConflicts(int n) {
        std::lock_guard<std::mutex> lock(locksMutex_);
        injectedCommitConflicts_ = n;
    }

    int commitCount() const {
        std::shared_lock<std::shared_mutex> lock(dataMutex_);
        return commits_;
    }

    int rollbackCount() const {
        std::lock_guard<std::mutex> lock(locksMutex_);
        return rollbacks_;
    }

    size_t ledgerSize() const {
        std::shared_lock<std::shared_mutex> lock(dataMutex_);
        return ledger_.size();
    }

    size_t heldLockCount() const {
        std::lock_guard<std::mutex> lock(locksMutex_);
        return rowLocks_.size();
    }

private:
    const LockingMode mode_;
    const std::chrono::milliseconds lockTimeout_;

    // Зафиксированные данные
    mutable std::shared_mutex dataMutex_;
    std::unordered_map<std::string, domain::Account> accounts_;   // accountId → Account
    std::map<std::string, std::string> idsByNumber_;              // accountNumber → accountId
    std::vector<domain::LedgerEntry> ledger_;
    int commits_ = 0;

    // Блокировки строк: accountNumber → transactionId
    mutable std::mutex locksMutex_;
    std::condition_variable lockReleased_;
    std::unordered_map<std::string, uint64_t> rowLocks_;
    uint64_t lastTransactionId_ = 0;
    int rollbacks_ = 0;
    int injectedLockConflicts_ = 0;
    int injectedCommitConflicts_ = 0;
};

} // namespace bank::adapters::secondary
