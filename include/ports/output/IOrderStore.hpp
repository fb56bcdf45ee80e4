#pragma once

#include "domain/Order.hpp"
#include "domain/OrderLine.hpp"
#include "domain/Money.hpp"
#include "domain/enums/OrderStatus.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace payment::ports::output {

/**
 * @brief Хранилище заказов и их позиций
 *
 * Инвариант: у покупателя не больше одного заказа в статусе OPEN.
 * Мутации выполняются внутри IUnitOfWork.
 */
class IOrderStore {
public:
    virtual ~IOrderStore() = default;

    // ============================================
    // ЧТЕНИЕ
    // ============================================

    /**
     * @brief Активная корзина покупателя (с позициями)
     */
    virtual std::optional<domain::Order> getOpenOrderForCustomer(const std::string& customerId) = 0;

    virtual std::optional<domain::Order> findById(const std::string& orderId) = 0;

    /**
     * @brief Все заказы покупателя, новые первыми
     */
    virtual std::vector<domain::Order> findByCustomer(const std::string& customerId) = 0;

    virtual std::vector<domain::OrderLine> getOrderLines(const std::string& orderId) = 0;

    /**
     * @brief Пересчитать сумму заказа по текущим позициям
     */
    virtual domain::Money computeOrderTotal(const std::string& orderId) = 0;

    // ============================================
    // ЗАПИСЬ
    // ============================================

    /**
     * @brief Вернуть OPEN заказ покупателя, создав его при отсутствии
     */
    virtual domain::Order getOrCreateOpenOrder(const std::string& customerId) = 0;

    /**
     * @brief Вставить позицию или обновить существующую (по orderId + productKey)
     */
    virtual domain::OrderLine upsertLine(const domain::OrderLine& line) = 0;

    /**
     * @brief Установить количество; quantity <= 0 удаляет позицию
     * @return false если позиции нет
     */
    virtual bool setLineQuantity(const std::string& orderId, const std::string& productKey,
                                 int64_t quantity) = 0;

    virtual bool removeLine(const std::string& orderId, const std::string& productKey) = 0;

    /**
     * @brief Удалить OPEN заказ вместе с позициями
     * @return false если заказа нет или он уже не OPEN
     */
    virtual bool deleteOrder(const std::string& orderId) = 0;

    /**
     * @brief Перевести заказ в status по таблице OrderStateMachine
     * @throws InvalidTransitionError если перехода из текущего статуса нет в таблице
     * @throws NotFoundError если заказа нет
     */
    virtual void setOrderStatus(const std::string& orderId, domain::OrderStatus status) = 0;

    /**
     * @brief Сменить статус только если текущий равен expected
     * @throws InvalidTransitionError если перехода expected → next нет в таблице
     * @return false если статус уже изменён другим запросом
     */
    virtual bool compareAndSetStatus(const std::string& orderId,
                                     domain::OrderStatus expected,
                                     domain::OrderStatus next) = 0;
};

} // namespace payment::ports::output
