#pragma once

#include <string>

namespace payment::domain {

/**
 * @brief События, переводящие заказ между статусами
 */
enum class OrderEvent {
    CHECKOUT_STARTED,
    PAYMENT_SUCCEEDED,
    PAYMENT_FAILED
};

inline std::string toString(OrderEvent event) {
    switch (event) {
        case OrderEvent::CHECKOUT_STARTED: return "CHECKOUT_STARTED";
        case OrderEvent::PAYMENT_SUCCEEDED: return "PAYMENT_SUCCEEDED";
        case OrderEvent::PAYMENT_FAILED: return "PAYMENT_FAILED";
        default: return "UNKNOWN";
    }
}

} // namespace payment::domain
