// include/ports/input/Commands.hpp
#pragma once

#include "domain/Money.hpp"
#include "domain/Timestamp.hpp"
#include "domain/enums/LedgerEntryType.hpp"
#include <optional>
#include <string>
#include <cstdint>

namespace bank::ports::input {

// ============================================================================
// Команды (вход)
// ============================================================================

struct CreateAccountCommand {
    std::string accountNumber;
    int64_t initialBalanceCents = 0;
    std::string currency = domain::Money::DEFAULT_CURRENCY;
};

struct DepositCommand {
    std::string accountNumber;
    int64_t amountCents = 0;
    std::string currency = domain::Money::DEFAULT_CURRENCY;
};

struct WithdrawCommand {
    std::string accountNumber;
    int64_t amountCents = 0;
    std::string currency = domain::Money::DEFAULT_CURRENCY;
};

struct TransferCommand {
    std::string fromAccountNumber;
    std::string toAccountNumber;
    int64_t amountCents = 0;
    std::string currency = domain::Money::DEFAULT_CURRENCY;
};

// ============================================================================
// Результаты (выход)
// ============================================================================

struct AccountCreatedResult {
    std::string accountId;
    std::string accountNumber;
    int64_t balanceCents = 0;
    std::string currency;
};

struct BalanceResult {
    std::string accountNumber;
    int64_t balanceCents = 0;
    std::string currency;
};

/**
 * @brief Результат зачисления / списания
 */
struct TransactionResult {
    std::string accountNumber;
    int64_t balanceCents = 0;
    std::string currency;
};

struct TransferResult {
    std::string correlationId;
    std::string fromAccountNumber;
    std::string toAccountNumber;
    int64_t fromBalanceCents = 0;
    int64_t toBalanceCents = 0;
    std::string currency;
};

/**
 * @brief Проводка в выдаче истории операций
 */
struct LedgerEntryView {
    std::string entryId;
    domain::LedgerEntryType entryType = domain::LedgerEntryType::DEPOSIT;
    int64_t amountCents = 0;
    std::string currency;
    std::optional<std::string> correlationId;
    std::optional<std::string> counterpartyAccountNumber;
    domain::Timestamp occurredAt;
};

} // namespace bank::ports::input
