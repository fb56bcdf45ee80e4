#pragma once

#include "Money.hpp"
#include "Timestamp.hpp"
#include "enums/PaymentStatus.hpp"
#include <string>
#include <optional>

namespace payment::domain {

/**
 * @brief Запись журнала платежей (одна на попытку оплаты)
 */
class PaymentTransaction {
public:
    std::string id;
    std::string orderId;
    std::string customerId;
    std::string paymentMethod;
    Money amount;
    PaymentStatus status = PaymentStatus::PENDING;
    Timestamp processedAt;
    std::optional<std::string> externalTransactionId;
    std::optional<std::string> errorMessage;
};

} // namespace payment::domain
