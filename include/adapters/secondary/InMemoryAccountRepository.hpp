// include/adapters/secondary/InMemoryAccountRepository.hpp
#pragma once

#include "ports/output/IAccountRepository.hpp"
#include "adapters/secondary/InMemoryBankStore.hpp"
#include <algorithm>
#include <memory>

namespace bank::adapters::secondary {

/**
 * @brief Репозиторий счетов поверх InMemoryBankStore в рамках одной транзакции
 *
 * Записи копятся в InMemoryTransaction и видны только своей транзакции
 * (read-your-writes), пока commit() не перенесёт их в хранилище.
 */
class InMemoryAccountRepository : public ports::output::IAccountRepository {
public:
    InMemoryAccountRepository(std::shared_ptr<InMemoryBankStore> store, InMemoryTransaction& tx)
        : store_(std::move(store)), tx_(tx) {}

    std::optional<domain::Account> getByNumber(const domain::AccountNumber& number) override {
        if (auto* pending = findPending(number)) {
            return pending->account;
        }
        return store_->findByNumber(number);
    }

    domain::Result<std::optional<domain::Account>> getByNumberForUpdate(
        const domain::AccountNumber& number) override
    {
        auto locked = store_->lockByNumber(tx_.id, number);
        if (!locked) {
            return locked;
        }
        // Строка уже изменена этой транзакцией: отдаём свою версию
        if (auto* pending = findPending(number)) {
            return domain::Result<std::optional<domain::Account>>::success(pending->account);
        }
        return locked;
    }

    domain::Result<domain::Account> save(const domain::Account& account) override {
        using Saved = domain::Result<domain::Account>;

        auto pending = std::find_if(tx_.accountWrites.begin(), tx_.accountWrites.end(),
            [&](const PendingAccountWrite& w) { return w.account.accountId() == account.accountId(); });

        if (pending != tx_.accountWrites.end()) {
            if (pending->account.version() != account.version()) {
                return Saved::failure(domain::ErrorKind::CONCURRENCY_CONFLICT,
                    "Stale copy of account " + account.accountNumber().value());
            }
            pending->account = account.withVersion(account.version() + 1);
            return Saved::success(pending->account);
        }

        if (account.isNew()) {
            if (store_->numberTaken(account.accountNumber())) {
                return Saved::failure(domain::ErrorKind::ACCOUNT_ALREADY_EXISTS,
                    "Account " + account.accountNumber().value() + " already exists");
            }
        } else {
            auto committed = store_->committedVersion(account.accountId());
            if (!committed || *committed != account.version()) {
                return Saved::failure(domain::ErrorKind::CONCURRENCY_CONFLICT,
                    "Account " + account.accountNumber().value() + " was modified concurrently");
            }
        }

        auto persisted = account.withVersion(account.version() + 1);
        tx_.accountWrites.push_back(PendingAccountWrite{persisted, account.version()});
        return Saved::success(persisted);
    }

private:
    std::shared_ptr<InMemoryBankStore> store_;
    InMemoryTransaction& tx_;

    PendingAccountWrite* findPending(const domain::AccountNumber& number) {
        for (auto& write : tx_.accountWrites) {
            if (write.account.accountNumber() == number) {
                return &write;
            }
        }
        return nullptr;
    }
};

} // namespace bank::adapters::secondary
