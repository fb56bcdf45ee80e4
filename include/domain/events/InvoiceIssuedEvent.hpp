#pragma once

#include "DomainEvent.hpp"
#include "domain/Money.hpp"
#include <string>

namespace payment::domain {

/**
 * @brief Событие: выставлен счёт для банковского перевода
 */
struct InvoiceIssuedEvent : public DomainEvent {
    std::string orderId;
    std::string customerId;
    std::string transactionId;
    Money amount;
    Timestamp validUntil;

    InvoiceIssuedEvent() : DomainEvent("invoice.issued") {}

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<InvoiceIssuedEvent>(*this);
    }
};

} // namespace payment::domain
