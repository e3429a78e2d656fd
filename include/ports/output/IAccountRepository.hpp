// include/ports/output/IAccountRepository.hpp
#pragma once

#include "domain/Account.hpp"
#include "domain/AccountNumber.hpp"
#include "domain/Result.hpp"
#include <optional>

namespace bank::ports::output {

/**
 * @brief Репозиторий счетов, привязанный к одной транзакции (IUnitOfWork)
 *
 * Ошибки инфраструктуры (нет соединения и т.п.) - исключения.
 * Конфликт конкурентного доступа - всегда CONCURRENCY_CONFLICT в Result.
 */
class IAccountRepository {
public:
    virtual ~IAccountRepository() = default;

    /**
     * @brief Простое чтение без блокировки
     */
    virtual std::optional<domain::Account> getByNumber(const domain::AccountNumber& number) = 0;

    /**
     * @brief Чтение с намерением изменить (эксклюзивная блокировка строки)
     *
     * Пока транзакция открыта, никакая другая транзакция не получит
     * такую же блокировку на ту же строку. Хранилище без строковых
     * блокировок делает простое чтение и полагается на проверку version
     * при записи.
     *
     * @return CONCURRENCY_CONFLICT при таймауте ожидания / занятой строке
     */
    virtual domain::Result<std::optional<domain::Account>> getByNumberForUpdate(
        const domain::AccountNumber& number) = 0;

    /**
     * @brief Upsert по accountId в рамках текущей транзакции
     *
     * Новый счёт (version == 0) вставляется с version = 1, существующий
     * обновляется только если сохранённая version совпадает с прочитанной.
     *
     * @return Счёт с новой version;
     *         CONCURRENCY_CONFLICT если version в хранилище уже ушла вперёд;
     *         ACCOUNT_ALREADY_EXISTS если номер счёта занят
     */
    virtual domain::Result<domain::Account> save(const domain::Account& account) = 0;
};

} // namespace bank::ports::output
