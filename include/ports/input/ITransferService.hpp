#pragma once

#include "ports/input/Commands.hpp"
#include "domain/Result.hpp"

namespace bank::ports::input {

/**
 * @brief Перевод между двумя счетами
 */
class ITransferService {
public:
    virtual ~ITransferService() = default;

    /**
     * @brief Перевести amount со счёта from на счёт to
     *
     * Ошибки: SAME_ACCOUNT_TRANSFER, валидация, ACCOUNT_NOT_FOUND,
     * INSUFFICIENT_FUNDS, CONCURRENCY_CONFLICT (после исчерпания попыток).
     * При любой ошибке балансы обоих счетов не меняются.
     */
    virtual domain::Result<TransferResult> transfer(const TransferCommand& command) = 0;
};

} // namespace bank::ports::input
