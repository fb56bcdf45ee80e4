#pragma once

#include <string>

namespace payment::domain {

enum class OrderStatus {
    OPEN,
    CHECKOUT,
    PAID,
    CANCELLED
};

inline std::string toString(OrderStatus status) {
    switch (status) {
        case OrderStatus::OPEN: return "OPEN";
        case OrderStatus::CHECKOUT: return "CHECKOUT";
        case OrderStatus::PAID: return "PAID";
        case OrderStatus::CANCELLED: return "CANCELLED";
        default: return "UNKNOWN";
    }
}

inline OrderStatus parseOrderStatus(const std::string& str) {
    if (str == "CHECKOUT") return OrderStatus::CHECKOUT;
    if (str == "PAID") return OrderStatus::PAID;
    if (str == "CANCELLED") return OrderStatus::CANCELLED;
    return OrderStatus::OPEN;
}

} // namespace payment::domain
