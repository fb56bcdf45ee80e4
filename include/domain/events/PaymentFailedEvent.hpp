#pragma once

#include "DomainEvent.hpp"
#include "domain/Money.hpp"
#include <string>

namespace payment::domain {

/**
 * @brief Событие: шлюз отказал или повторы исчерпаны, заказ отменён
 */
struct PaymentFailedEvent : public DomainEvent {
    std::string orderId;
    std::string customerId;
    std::string transactionId;
    std::string paymentMethod;
    std::string reason;
    Money amount;

    PaymentFailedEvent() : DomainEvent("payment.failed") {}

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<PaymentFailedEvent>(*this);
    }
};

} // namespace payment::domain
