#include "domain/events/PaymentCompletedEvent.hpp"
#include <nlohmann/json.hpp>

namespace payment::domain {

std::string PaymentCompletedEvent::toJson() const {
    nlohmann::json j;
    j["eventId"] = eventId;
    j["eventType"] = eventType;
    j["timestamp"] = timestamp.toString();
    j["orderId"] = orderId;
    j["customerId"] = customerId;
    j["transactionId"] = transactionId;
    j["paymentMethod"] = paymentMethod;
    j["externalTransactionId"] = externalTransactionId;
    j["amount"] = {
        {"units", amount.units},
        {"nano", amount.nano},
        {"currency", amount.currency}
    };
    return j.dump();
}

} // namespace payment::domain
