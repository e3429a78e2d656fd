// include/ports/output/IUnitOfWork.hpp
#pragma once

#include "ports/output/IAccountRepository.hpp"
#include "ports/output/ILedgerRepository.hpp"
#include "domain/Result.hpp"
#include <memory>

namespace bank::ports::output {

/**
 * @brief Транзакционная граница (Unit of Work)
 *
 * Жизненный цикл:
 * 1. IUnitOfWorkFactory::begin() открывает транзакцию
 * 2. accounts() / ledger() работают внутри неё
 * 3. commit() фиксирует всё разом
 * 4. Деструктор без commit() откатывает транзакцию (RAII)
 *
 * Один экземпляр = одна транзакция, не реентерабелен.
 * После commit()/rollback() объект завершён: повторный commit() -
 * ошибка программиста (std::logic_error).
 *
 * @example
 * ```cpp
 * auto uow = factory->begin();
 * auto account = uow->accounts().getByNumberForUpdate(number);
 * ...
 * auto committed = uow->commit();
 * if (!committed) return committed.error();   // откат уже выполнен
 * ```
 */
class IUnitOfWork {
public:
    virtual ~IUnitOfWork() = default;

    virtual IAccountRepository& accounts() = 0;
    virtual ILedgerRepository& ledger() = 0;

    /**
     * @brief Зафиксировать транзакцию
     *
     * @return CONCURRENCY_CONFLICT при несовпадении version или при
     *         сигнале занятости блокировок; транзакция при этом откатывается.
     *         Прочие сбои хранилища пробрасываются исключением.
     */
    virtual domain::Status commit() = 0;

    /**
     * @brief Откатить транзакцию. Идемпотентен, безопасен после неудачного commit().
     */
    virtual void rollback() = 0;

    virtual bool isActive() const = 0;
};

/**
 * @brief Фабрика транзакций: каждая попытка ретрая берёт новую
 */
class IUnitOfWorkFactory {
public:
    virtual ~IUnitOfWorkFactory() = default;

    virtual std::unique_ptr<IUnitOfWork> begin() = 0;
};

} // namespace bank::ports::output
