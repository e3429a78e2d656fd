// include/application/RetryExecutor.hpp
#pragma once

#include "settings/IRetrySettings.hpp"
#include "domain/Result.hpp"
#include <algorithm>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <type_traits>

namespace bank::application {

/**
 * @brief Ограниченный повтор транзакционной попытки при конфликте
 *
 * Каждая попытка обязана открыть новую транзакцию (IUnitOfWork) и пройти
 * весь цикл чтение → изменение → запись → commit с нуля. Повторяется только
 * CONCURRENCY_CONFLICT; любой другой результат возвращается сразу.
 * После последней неудачной попытки возвращается CONCURRENCY_CONFLICT.
 *
 * @example
 * ```cpp
 * return retry_.run("withdraw", [&](int attempt) {
 *     return withdrawOnce(number, amount, attempt);
 * });
 * ```
 */
class RetryExecutor {
public:
    explicit RetryExecutor(std::shared_ptr<settings::IRetrySettings> settings)
        : settings_(std::move(settings)) {}

    template <typename AttemptFn>
    auto run(const std::string& operation, AttemptFn&& attempt) const
        -> std::invoke_result_t<AttemptFn&, int>
    {
        using ResultType = std::invoke_result_t<AttemptFn&, int>;

        const int maxAttempts = std::max(1, settings_->getMaxAttempts());

        for (int n = 1; n <= maxAttempts; ++n) {
            ResultType result = attempt(n);

            if (!result.is(domain::ErrorKind::CONCURRENCY_CONFLICT)) {
                return result;
            }

            std::cerr << "[RetryExecutor] " << operation << " conflict on attempt "
                      << n << "/" << maxAttempts << ": " << result.error().message << std::endl;

            if (n < maxAttempts) {
                pause(n);
            }
        }

        return ResultType::failure(domain::ErrorKind::CONCURRENCY_CONFLICT,
            operation + " failed after " + std::to_string(maxAttempts) + " attempts");
    }

    int maxAttempts() const { return std::max(1, settings_->getMaxAttempts()); }

private:
    std::shared_ptr<settings::IRetrySettings> settings_;

    void pause(int attempt) const {
        auto backoff = settings_->getBackoff();
        if (backoff.count() > 0) {
            std::this_thread::sleep_for(backoff * attempt);
        }
    }
};

} // namespace bank::application
