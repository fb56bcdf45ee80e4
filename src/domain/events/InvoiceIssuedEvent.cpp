#include "domain/events/InvoiceIssuedEvent.hpp"
#include <nlohmann/json.hpp>

namespace payment::domain {

std::string InvoiceIssuedEvent::toJson() const {
    nlohmann::json j;
    j["eventId"] = eventId;
    j["eventType"] = eventType;
    j["timestamp"] = timestamp.toString();
    j["orderId"] = orderId;
    j["customerId"] = customerId;
    j["transactionId"] = transactionId;
    j["amount"] = {
        {"units", amount.units},
        {"nano", amount.nano},
        {"currency", amount.currency}
    };
    j["validUntil"] = validUntil.toString();
    return j.dump();
}

} // namespace payment::domain
