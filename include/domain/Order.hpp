#pragma once

#include "Money.hpp"
#include "Timestamp.hpp"
#include "OrderLine.hpp"
#include "OrderStateMachine.hpp"
#include "enums/OrderStatus.hpp"
#include <string>
#include <vector>
#include <optional>

namespace payment::domain {

/**
 * @brief Заказ покупателя
 *
 * Пока статус OPEN, заказ является корзиной. Статус меняется только
 * через OrderStateMachine.
 */
class Order {
public:
    std::string id;
    std::string customerId;
    OrderStatus status = OrderStatus::OPEN;
    Timestamp createdAt;
    Timestamp updatedAt;
    std::optional<Timestamp> finalizedAt;   // Только для PAID / CANCELLED
    std::vector<OrderLine> lines;

    Order() = default;

    Order(const std::string& id_, const std::string& customer)
        : id(id_)
        , customerId(customer)
        , status(OrderStatus::OPEN)
        , createdAt(Timestamp::now())
        , updatedAt(Timestamp::now())
    {}

    /**
     * @brief Сумма по позициям, ровно ноль для пустого списка
     */
    static Money computeTotal(const std::vector<OrderLine>& lines, const std::string& currency = "USD") {
        Money total = Money::zero(lines.empty() ? currency : lines.front().unitPrice.currency);
        for (const auto& line : lines) {
            total = total + line.lineTotal();
        }
        return total;
    }

    Money total() const {
        return computeTotal(lines);
    }

    int64_t totalItems() const {
        int64_t count = 0;
        for (const auto& line : lines) {
            count += line.quantity;
        }
        return count;
    }

    bool isOpen() const {
        return status == OrderStatus::OPEN;
    }

    /**
     * @brief Применить событие к статусу (проверяется таблицей переходов)
     */
    void apply(OrderEvent event) {
        updateStatus(OrderStateMachine::next(status, event));
    }

    void updateStatus(OrderStatus newStatus) {
        status = newStatus;
        updatedAt = Timestamp::now();
        if (OrderStateMachine::isTerminal(newStatus)) {
            finalizedAt = updatedAt;
        }
    }
};

} // namespace payment::domain
