#pragma once

#include "DomainEvent.hpp"
#include "domain/Money.hpp"
#include <string>

namespace payment::domain {

/**
 * @brief Событие: платёж подтверждён шлюзом, заказ оплачен
 */
struct PaymentCompletedEvent : public DomainEvent {
    std::string orderId;
    std::string customerId;
    std::string transactionId;
    std::string paymentMethod;
    std::string externalTransactionId;
    Money amount;

    PaymentCompletedEvent() : DomainEvent("payment.completed") {}

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<PaymentCompletedEvent>(*this);
    }
};

} // namespace payment::domain
