// include/domain/Result.hpp
#pragma once

#include "enums/ErrorKind.hpp"
#include <string>
#include <variant>
#include <stdexcept>
#include <utility>

namespace bank::domain {

/**
 * @brief Ошибка операции: вид + причина для человека
 */
struct Error {
    ErrorKind kind;
    std::string message;
};

/**
 * @brief Результат операции: значение либо Error
 *
 * Доменные, бизнесовые и конкурентные ошибки возвращаются через Result,
 * а не исключениями. Исключения остаются для сбоев инфраструктуры.
 *
 * @example
 * ```cpp
 * auto money = Money::of(1000, "BRL");
 * if (!money) {
 *     return Result<Account>::failure(money.error());
 * }
 * account.deposit(money.value());
 * ```
 */
template <typename T>
class Result {
public:
    static Result success(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    static Result failure(ErrorKind kind, std::string message) {
        return Result(std::in_place_index<1>, Error{kind, std::move(message)});
    }

    static Result failure(Error error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    bool ok() const { return data_.index() == 0; }
    explicit operator bool() const { return ok(); }

    const T& value() const& {
        ensureOk();
        return std::get<0>(data_);
    }

    T& value() & {
        ensureOk();
        return std::get<0>(data_);
    }

    /// Значение забирается из временного Result, поэтому возвращается по значению
    T value() && {
        ensureOk();
        return std::get<0>(std::move(data_));
    }

    const Error& error() const {
        if (ok()) {
            throw std::logic_error("Result holds a value, not an error");
        }
        return std::get<1>(data_);
    }

    /// Проверка вида ошибки; false для успешного результата
    bool is(ErrorKind kind) const {
        return !ok() && std::get<1>(data_).kind == kind;
    }

private:
    template <std::size_t I, typename U>
    Result(std::in_place_index_t<I> tag, U&& payload) : data_(tag, std::forward<U>(payload)) {}

    void ensureOk() const {
        if (!ok()) {
            throw std::logic_error("Result holds an error: " + std::get<1>(data_).message);
        }
    }

    std::variant<T, Error> data_;
};

/**
 * @brief Результат операции без значения
 */
template <>
class Result<void> {
public:
    static Result success() { return Result(); }

    static Result failure(ErrorKind kind, std::string message) {
        return Result(Error{kind, std::move(message)});
    }

    static Result failure(Error error) {
        return Result(std::move(error));
    }

    bool ok() const { return !failed_; }
    explicit operator bool() const { return ok(); }

    const Error& error() const {
        if (ok()) {
            throw std::logic_error("Result holds no error");
        }
        return error_;
    }

    bool is(ErrorKind kind) const {
        return failed_ && error_.kind == kind;
    }

private:
    Result() = default;
    explicit Result(Error error) : failed_(true), error_(std::move(error)) {}

    bool failed_ = false;
    Error error_{ErrorKind::CONCURRENCY_CONFLICT, ""};
};

using Status = Result<void>;

} // namespace bank::domain
