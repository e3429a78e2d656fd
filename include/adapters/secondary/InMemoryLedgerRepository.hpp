// include/adapters/secondary/InMemoryLedgerRepository.hpp
#pragma once

#include "ports/output/ILedgerRepository.hpp"
#include "adapters/secondary/InMemoryBankStore.hpp"
#include <memory>

namespace bank::adapters::secondary {

class InMemoryLedgerRepository : public ports::output::ILedgerRepository {
public:
    InMemoryLedgerRepository(std::shared_ptr<InMemoryBankStore> store, InMemoryTransaction& tx)
        : store_(std::move(store)), tx_(tx) {}

    void save(const domain::LedgerEntry& entry) override {
        tx_.ledgerWrites.push_back(entry);
    }

    std::vector<domain::LedgerEntry> listByAccount(const domain::AccountId& accountId) override {
        auto entries = store_->ledgerFor(accountId);
        for (const auto& entry : tx_.ledgerWrites) {
            if (entry.accountId() == accountId) {
                entries.push_back(entry);
            }
        }
        return entries;
    }

private:
    std::shared_ptr<InMemoryBankStore> store_;
    InMemoryTransaction& tx_;
};

} // namespace bank::adapters::secondary
