#pragma once

#include "Errors.hpp"
#include "enums/OrderStatus.hpp"
#include "enums/OrderEvent.hpp"
#include <map>
#include <utility>

namespace payment::domain {

/**
 * @brief Таблица переходов статуса заказа
 *
 *   OPEN     + CHECKOUT_STARTED  → CHECKOUT
 *   CHECKOUT + PAYMENT_SUCCEEDED → PAID
 *   CHECKOUT + PAYMENT_FAILED    → CANCELLED
 *
 * PAID и CANCELLED терминальные. Любая другая пара → InvalidTransitionError.
 */
class OrderStateMachine {
public:
    static OrderStatus next(OrderStatus from, OrderEvent event) {
        const auto& table = transitions();
        auto it = table.find({from, event});
        if (it == table.end()) {
            throw InvalidTransitionError(
                "Invalid order transition: " + toString(from) + " + " + toString(event));
        }
        return it->second;
    }

    static bool canApply(OrderStatus from, OrderEvent event) {
        return transitions().count({from, event}) > 0;
    }

    /**
     * @brief Есть ли в таблице переход from → to
     */
    static bool allows(OrderStatus from, OrderStatus to) {
        for (const auto& [key, target] : transitions()) {
            if (key.first == from && target == to) {
                return true;
            }
        }
        return false;
    }

    /**
     * @brief Проверка перехода по статусам, для хранилищ
     */
    static void requireTransition(OrderStatus from, OrderStatus to) {
        if (!allows(from, to)) {
            throw InvalidTransitionError(
                "Invalid order transition: " + toString(from) + " -> " + toString(to));
        }
    }

    static bool isTerminal(OrderStatus status) {
        return status == OrderStatus::PAID || status == OrderStatus::CANCELLED;
    }

private:
    using Key = std::pair<OrderStatus, OrderEvent>;

    static const std::map<Key, OrderStatus>& transitions() {
        static const std::map<Key, OrderStatus> table = {
            {{OrderStatus::OPEN, OrderEvent::CHECKOUT_STARTED}, OrderStatus::CHECKOUT},
            {{OrderStatus::CHECKOUT, OrderEvent::PAYMENT_SUCCEEDED}, OrderStatus::PAID},
            {{OrderStatus::CHECKOUT, OrderEvent::PAYMENT_FAILED}, OrderStatus::CANCELLED},
        };
        return table;
    }
};

} // namespace payment::domain
