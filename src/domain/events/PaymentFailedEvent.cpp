// payment-service/src/domain/events/PaymentFailedEvent.cpp
#include "domain/events/PaymentFailedEvent.hpp"
#include <nlohmann/json.hpp>

namespace payment::domain {

std::string PaymentFailedEvent::toJson() const {
    nlohmann::json j;
    j["eventId"] = eventId;
    j["eventType"] = eventType;
    j["timestamp"] = timestamp.toString();
    j["orderId"] = orderId;
    j["customerId"] = customerId;
    j["transactionId"] = transactionId;
    j["paymentMethod"] = paymentMethod;
    j["reason"] = reason;
    j["amount"] = amount.toDouble();
    j["currency"] = amount.currency;
    return j.dump();
}

} // namespace payment::domain
