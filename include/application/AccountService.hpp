// include/application/AccountService.hpp
#pragma once

#include "ports/input/IAccountService.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include "settings/IRetrySettings.hpp"
#include "application/RetryExecutor.hpp"
#include "domain/Account.hpp"
#include "domain/AccountNumber.hpp"
#include "domain/LedgerEntry.hpp"
#include "domain/Money.hpp"
#include <algorithm>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace bank::application {

/**
 * @brief Сервис операций над одним счётом
 *
 * Каждая операция - одна транзакция (IUnitOfWork):
 * - createAccount: одна попытка, проверка уникальности номера + commit
 * - deposit / withdraw: блокировка строки → изменение → проводка → save → commit,
 *   весь цикл повторяется RetryExecutor при CONCURRENCY_CONFLICT
 * - getBalance / getTransactions: согласованное чтение без изменений
 *
 * Незафиксированная транзакция откатывается деструктором IUnitOfWork,
 * поэтому любой ранний return безопасен.
 */
class AccountService : public ports::input::IAccountService {
public:
    AccountService(
        std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory,
        std::shared_ptr<settings::IRetrySettings> retrySettings
    ) : uowFactory_(std::move(uowFactory))
      , retry_(std::move(retrySettings))
    {
        std::cout << "[AccountService] Created" << std::endl;
    }

    domain::Result<ports::input::AccountCreatedResult> createAccount(
        const ports::input::CreateAccountCommand& command) override
    {
        using Created = domain::Result<ports::input::AccountCreatedResult>;

        auto number = domain::AccountNumber::parse(command.accountNumber);
        if (!number) {
            return Created::failure(number.error());
        }

        auto initial = domain::Money::of(command.initialBalanceCents, command.currency);
        if (!initial) {
            return Created::failure(initial.error());
        }

        auto uow = uowFactory_->begin();

        if (uow->accounts().getByNumber(number.value())) {
            return Created::failure(domain::ErrorKind::ACCOUNT_ALREADY_EXISTS,
                "Account " + number.value().value() + " already exists");
        }

        auto opened = domain::Account::open(number.value(), initial.value().currency());
        if (!opened) {
            return Created::failure(opened.error());
        }
        domain::Account account = std::move(opened).value();

        // Начальный баланс - обычное зачисление с проводкой DEPOSIT
        if (!initial.value().isZero()) {
            auto deposited = account.deposit(initial.value());
            if (!deposited) {
                return Created::failure(deposited.error());
            }

            auto entry = domain::LedgerEntry::create(account.accountId(),
                                                     domain::LedgerEntryType::DEPOSIT,
                                                     initial.value());
            if (!entry) {
                return Created::failure(entry.error());
            }
            uow->ledger().save(entry.value());
        }

        auto saved = uow->accounts().save(account);
        if (!saved) {
            return Created::failure(saved.error());
        }

        auto committed = uow->commit();
        if (!committed) {
            return Created::failure(committed.error());
        }

        const auto& persisted = saved.value();
        std::cout << "[AccountService] Account created: " << persisted.accountNumber().value()
                  << " id=" << persisted.accountId().value()
                  << " balance=" << persisted.balance().toString() << std::endl;

        return Created::success(ports::input::AccountCreatedResult{
            persisted.accountId().value(),
            persisted.accountNumber().value(),
            persisted.balance().amountCents(),
            persisted.balance().currency()
        });
    }

    domain::Result<ports::input::TransactionResult> deposit(
        const ports::input::DepositCommand& command) override
    {
        return changeBalance(command.accountNumber, command.amountCents, command.currency,
                             domain::LedgerEntryType::DEPOSIT);
    }

    domain::Result<ports::input::TransactionResult> withdraw(
        const ports::input::WithdrawCommand& command) override
    {
        return changeBalance(command.accountNumber, command.amountCents, command.currency,
                             domain::LedgerEntryType::WITHDRAWAL);
    }

    domain::Result<ports::input::BalanceResult> getBalance(const std::string& accountNumber) override {
        using Balance = domain::Result<ports::input::BalanceResult>;

        auto number = domain::AccountNumber::parse(accountNumber);
        if (!number) {
            return Balance::failure(number.error());
        }

        auto uow = uowFactory_->begin();
        auto account = uow->accounts().getByNumber(number.value());
        if (!account) {
            return Balance::failure(domain::ErrorKind::ACCOUNT_NOT_FOUND,
                "Account " + number.value().value() + " not found");
        }

        return Balance::success(ports::input::BalanceResult{
            account->accountNumber().value(),
            account->balance().amountCents(),
            account->balance().currency()
        });
    }

    /**
     * @brief История проводок счёта, новые первыми
     *
     * Проводки с одинаковым occurredAt идут в обратном порядке записи.
     */
    domain::Result<std::vector<ports::input::LedgerEntryView>> getTransactions(
        const std::string& accountNumber) override
    {
        using History = domain::Result<std::vector<ports::input::LedgerEntryView>>;

        auto number = domain::AccountNumber::parse(accountNumber);
        if (!number) {
            return History::failure(number.error());
        }

        auto uow = uowFactory_->begin();
        auto account = uow->accounts().getByNumber(number.value());
        if (!account) {
            return History::failure(domain::ErrorKind::ACCOUNT_NOT_FOUND,
                "Account " + number.value().value() + " not found");
        }

        auto entries = uow->ledger().listByAccount(account->accountId());
        std::reverse(entries.begin(), entries.end());
        std::stable_sort(entries.begin(), entries.end(),
            [](const domain::LedgerEntry& a, const domain::LedgerEntry& b) {
                return a.occurredAt() > b.occurredAt();
            });

        std::vector<ports::input::LedgerEntryView> views;
        views.reserve(entries.size());
        for (const auto& entry : entries) {
            ports::input::LedgerEntryView view;
            view.entryId = entry.entryId();
            view.entryType = entry.type();
            view.amountCents = entry.amount().amountCents();
            view.currency = entry.amount().currency();
            view.correlationId = entry.correlationId();
            if (entry.counterpartyAccountNumber()) {
                view.counterpartyAccountNumber = entry.counterpartyAccountNumber()->value();
            }
            view.occurredAt = entry.occurredAt();
            views.push_back(std::move(view));
        }

        return History::success(std::move(views));
    }

private:
    std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory_;
    RetryExecutor retry_;

    domain::Result<ports::input::TransactionResult> changeBalance(
        const std::string& accountNumber,
        int64_t amountCents,
        const std::string& currency,
        domain::LedgerEntryType type)
    {
        using Outcome = domain::Result<ports::input::TransactionResult>;

        auto number = domain::AccountNumber::parse(accountNumber);
        if (!number) {
            return Outcome::failure(number.error());
        }

        auto amount = domain::Money::of(amountCents, currency);
        if (!amount) {
            return Outcome::failure(amount.error());
        }
        if (amount.value().isZero()) {
            return Outcome::failure(domain::ErrorKind::INVALID_AMOUNT,
                "Amount must be greater than zero");
        }

        const std::string operation =
            type == domain::LedgerEntryType::DEPOSIT ? "deposit" : "withdraw";

        return retry_.run(operation, [&](int attempt) {
            return changeBalanceOnce(number.value(), amount.value(), type, attempt);
        });
    }

    domain::Result<ports::input::TransactionResult> changeBalanceOnce(
        const domain::AccountNumber& number,
        const domain::Money& amount,
        domain::LedgerEntryType type,
        int attempt)
    {
        using Outcome = domain::Result<ports::input::TransactionResult>;

        auto uow = uowFactory_->begin();

        auto locked = uow->accounts().getByNumberForUpdate(number);
        if (!locked) {
            return Outcome::failure(locked.error());
        }
        if (!locked.value()) {
            return Outcome::failure(domain::ErrorKind::ACCOUNT_NOT_FOUND,
                "Account " + number.value() + " not found");
        }

        domain::Account account = *locked.value();

        auto changed = type == domain::LedgerEntryType::DEPOSIT
            ? account.deposit(amount)
            : account.withdraw(amount);
        if (!changed) {
            std::cout << "[AccountService] " << domain::toString(type) << " rejected for "
                      << number.value() << ": " << changed.error().message << std::endl;
            return Outcome::failure(changed.error());
        }

        auto entry = domain::LedgerEntry::create(account.accountId(), type, amount);
        if (!entry) {
            return Outcome::failure(entry.error());
        }
        uow->ledger().save(entry.value());

        auto saved = uow->accounts().save(account);
        if (!saved) {
            return Outcome::failure(saved.error());
        }

        auto committed = uow->commit();
        if (!committed) {
            return Outcome::failure(committed.error());
        }

        const auto& persisted = saved.value();
        std::cout << "[AccountService] " << domain::toString(type) << " " << amount.toString()
                  << " account=" << number.value()
                  << " balance=" << persisted.balance().toString()
                  << " version=" << persisted.version()
                  << " attempt=" << attempt << std::endl;

        return Outcome::success(ports::input::TransactionResult{
            persisted.accountNumber().value(),
            persisted.balance().amountCents(),
            persisted.balance().currency()
        });
    }
};

} // namespace bank::application
