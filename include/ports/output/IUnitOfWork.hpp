#pragma once

namespace payment::ports::output {

/**
 * @brief Единица работы над хранилищем заказов и журналом транзакций
 *
 * Единицы работы выполняются последовательно (одна за другой на хранилище),
 * rollback() отменяет всё, что сделано после begin().
 * begin/commit/rollback вызываются из одного потока.
 */
class IUnitOfWork {
public:
    virtual ~IUnitOfWork() = default;

    virtual void begin() = 0;
    virtual void commit() = 0;
    virtual void rollback() = 0;
};

} // namespace payment::ports::output
