// include/application/TransferService.hpp
#pragma once

#include "ports/input/ITransferService.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include "settings/IRetrySettings.hpp"
#include "application/AccountLocking.hpp"
#include "application/RetryExecutor.hpp"
#include "domain/Account.hpp"
#include "domain/AccountNumber.hpp"
#include "domain/LedgerEntry.hpp"
#include "domain/Money.hpp"
#include "utils/UuidGenerator.hpp"
#include <iostream>
#include <memory>
#include <string>

namespace bank::application {

/**
 * @brief Перевод между счетами
 *
 * Поток одной попытки:
 * 1. Открыть транзакцию
 * 2. Заблокировать оба счёта в порядке возрастания номера (lockInAscendingOrder)
 * 3. withdraw с источника, deposit на получателя
 * 4. Проводки TRANSFER_OUT + TRANSFER_IN с общим correlationId
 * 5. Сохранить оба счёта (в том же порядке), commit
 *
 * correlationId генерируется один раз на вызов и переиспользуется во всех
 * попытках: закоммитится ровно одна пара проводок с этим id.
 */
class TransferService : public ports::input::ITransferService {
public:
    TransferService(
        std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory,
        std::shared_ptr<settings::IRetrySettings> retrySettings
    ) : uowFactory_(std::move(uowFactory))
      , retry_(std::move(retrySettings))
    {
        std::cout << "[TransferService] Created" << std::endl;
    }

    domain::Result<ports::input::TransferResult> transfer(
        const ports::input::TransferCommand& command) override
    {
        using Outcome = domain::Result<ports::input::TransferResult>;

        auto from = domain::AccountNumber::parse(command.fromAccountNumber);
        if (!from) {
            return Outcome::failure(from.error());
        }

        auto to = domain::AccountNumber::parse(command.toAccountNumber);
        if (!to) {
            return Outcome::failure(to.error());
        }

        if (from.value() == to.value()) {
            return Outcome::failure(domain::ErrorKind::SAME_ACCOUNT_TRANSFER,
                "Cannot transfer to the same account " + from.value().value());
        }

        auto amount = domain::Money::of(command.amountCents, command.currency);
        if (!amount) {
            return Outcome::failure(amount.error());
        }
        if (amount.value().isZero()) {
            return Outcome::failure(domain::ErrorKind::INVALID_AMOUNT,
                "Transfer amount must be greater than zero");
        }

        const std::string correlationId = utils::UuidGenerator::generate();

        return retry_.run("transfer", [&](int attempt) {
            return transferOnce(from.value(), to.value(), amount.value(), correlationId, attempt);
        });
    }

private:
    std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory_;
    RetryExecutor retry_;

    domain::Result<ports::input::TransferResult> transferOnce(
        const domain::AccountNumber& from,
        const domain::AccountNumber& to,
        const domain::Money& amount,
        const std::string& correlationId,
        int attempt)
    {
        using Outcome = domain::Result<ports::input::TransferResult>;

        auto uow = uowFactory_->begin();

        auto locked = lockInAscendingOrder(uow->accounts(), {from, to});
        if (!locked) {
            return Outcome::failure(locked.error());
        }

        // locked отсортирован по номеру, роли восстанавливаем по номеру
        auto& accounts = locked.value();
        const bool sourceFirst = accounts[0].accountNumber() == from;
        domain::Account source = sourceFirst ? accounts[0] : accounts[1];
        domain::Account destination = sourceFirst ? accounts[1] : accounts[0];

        auto withdrawn = source.withdraw(amount);
        if (!withdrawn) {
            std::cout << "[TransferService] Rejected " << from.value() << " -> " << to.value()
                      << ": " << withdrawn.error().message << std::endl;
            return Outcome::failure(withdrawn.error());
        }

        auto deposited = destination.deposit(amount);
        if (!deposited) {
            return Outcome::failure(deposited.error());
        }

        auto outgoing = domain::LedgerEntry::create(source.accountId(),
                                                    domain::LedgerEntryType::TRANSFER_OUT,
                                                    amount,
                                                    correlationId,
                                                    to);
        if (!outgoing) {
            return Outcome::failure(outgoing.error());
        }

        auto incoming = domain::LedgerEntry::create(destination.accountId(),
                                                    domain::LedgerEntryType::TRANSFER_IN,
                                                    amount,
                                                    correlationId,
                                                    from);
        if (!incoming) {
            return Outcome::failure(incoming.error());
        }

        uow->ledger().save(outgoing.value());
        uow->ledger().save(incoming.value());

        // Запись в том же порядке, что и блокировка: без строковых блокировок
        // UPDATE сам захватывает строки, и встречные переводы не должны зациклиться
        auto savedFirst = uow->accounts().save(sourceFirst ? source : destination);
        if (!savedFirst) {
            return Outcome::failure(savedFirst.error());
        }
        auto savedSecond = uow->accounts().save(sourceFirst ? destination : source);
        if (!savedSecond) {
            return Outcome::failure(savedSecond.error());
        }

        auto committed = uow->commit();
        if (!committed) {
            return Outcome::failure(committed.error());
        }

        const auto& persistedSource = sourceFirst ? savedFirst.value() : savedSecond.value();
        const auto& persistedDestination = sourceFirst ? savedSecond.value() : savedFirst.value();

        std::cout << "[TransferService] Transfer " << amount.toString()
                  << " " << from.value() << " -> " << to.value()
                  << " correlation=" << correlationId
                  << " balances=" << persistedSource.balance().amountCents()
                  << "/" << persistedDestination.balance().amountCents()
                  << " attempt=" << attempt << std::endl;

        return Outcome::success(ports::input::TransferResult{
            correlationId,
            from.value(),
            to.value(),
            persistedSource.balance().amountCents(),
            persistedDestination.balance().amountCents(),
            amount.currency()
        });
    }
};

} // namespace bank::application
