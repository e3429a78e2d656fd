// include/ports/input/IAccountService.hpp
#pragma once

#include "ports/input/Commands.hpp"
#include "domain/Result.hpp"
#include <string>
#include <vector>

namespace bank::ports::input {

/**
 * @brief Операции над одним счётом
 */
class IAccountService {
public:
    virtual ~IAccountService() = default;

    /**
     * @brief Открыть счёт (опционально с начальным зачислением)
     *
     * Ошибки: INVALID_ACCOUNT_NUMBER, INVALID_AMOUNT, INVALID_CURRENCY,
     * ACCOUNT_ALREADY_EXISTS
     */
    virtual domain::Result<AccountCreatedResult> createAccount(const CreateAccountCommand& command) = 0;

    /**
     * @brief Зачислить средства
     *
     * Ошибки: валидация, ACCOUNT_NOT_FOUND, CURRENCY_MISMATCH,
     * CONCURRENCY_CONFLICT (после исчерпания попыток)
     */
    virtual domain::Result<TransactionResult> deposit(const DepositCommand& command) = 0;

    /**
     * @brief Списать средства
     *
     * Ошибки: как у deposit + INSUFFICIENT_FUNDS
     */
    virtual domain::Result<TransactionResult> withdraw(const WithdrawCommand& command) = 0;

    virtual domain::Result<BalanceResult> getBalance(const std::string& accountNumber) = 0;

    /**
     * @brief История проводок, новые первыми
     */
    virtual domain::Result<std::vector<LedgerEntryView>> getTransactions(const std::string& accountNumber) = 0;
};

} // namespace bank::ports::input
