// include/adapters/secondary/InMemoryUnitOfWork.hpp
#pragma once

#include "ports/output/IUnitOfWork.hpp"
#include "adapters/secondary/InMemoryBankStore.hpp"
#include "adapters/secondary/InMemoryAccountRepository.hpp"
#include "adapters/secondary/InMemoryLedgerRepository.hpp"
#include <memory>
#include <stdexcept>

namespace bank::adapters::secondary {

/**
 * @brief Транзакция над InMemoryBankStore
 *
 * Буферизует записи, commit() применяет их атомарно. Блокировки строк
 * снимаются при любом завершении: commit (успешном или нет), rollback,
 * деструктор.
 */
class InMemoryUnitOfWork : public ports::output::IUnitOfWork {
public:
    explicit InMemoryUnitOfWork(std::shared_ptr<InMemoryBankStore> store)
        : store_(std::move(store))
        , accounts_(store_, tx_)
        , ledger_(store_, tx_)
    {
        tx_.id = store_->beginTransaction();
    }

    ~InMemoryUnitOfWork() override {
        rollback();
    }

    InMemoryUnitOfWork(const InMemoryUnitOfWork&) = delete;
    InMemoryUnitOfWork& operator=(const InMemoryUnitOfWork&) = delete;

    ports::output::IAccountRepository& accounts() override {
        ensureActive();
        return accounts_;
    }

    ports::output::ILedgerRepository& ledger() override {
        ensureActive();
        return ledger_;
    }

    domain::Status commit() override {
        ensureActive();
        active_ = false;

        domain::Status result = domain::Status::success();
        try {
            result = store_->commit(tx_.accountWrites, tx_.ledgerWrites);
        } catch (const std::exception&) {
            store_->release(tx_.id, false);
            throw;
        }

        store_->release(tx_.id, result.ok());
        return result;
    }

    void rollback() override {
        if (!active_) {
            return;
        }
        active_ = false;
        tx_.accountWrites.clear();
        tx_.ledgerWrites.clear();
        store_->release(tx_.id, false);
    }

    bool isActive() const override { return active_; }

private:
    std::shared_ptr<InMemoryBankStore> store_;
    InMemoryTransaction tx_;
    InMemoryAccountRepository accounts_;
    InMemoryLedgerRepository ledger_;
    bool active_ = true;

    void ensureActive() const {
        if (!active_) {
            throw std::logic_error("Unit of work is already finished");
        }
    }
};

/**
 * @brief Фабрика транзакций над общим InMemoryBankStore
 */
class InMemoryUnitOfWorkFactory : public ports::output::IUnitOfWorkFactory {
public:
    explicit InMemoryUnitOfWorkFactory(std::shared_ptr<InMemoryBankStore> store)
        : store_(std::move(store)) {}

    std::unique_ptr<ports::output::IUnitOfWork> begin() override {
        return std::make_unique<InMemoryUnitOfWork>(store_);
    }

    const std::shared_ptr<InMemoryBankStore>& store() const { return store_; }

private:
    std::shared_ptr<InMemoryBankStore> store_;
};

} // namespace bank::adapters::secondary
