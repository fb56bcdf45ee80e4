#pragma once

#include "Money.hpp"
#include "Timestamp.hpp"
#include <string>

namespace payment::domain {

/**
 * @brief Данные счёта для банковского перевода
 */
struct BankInvoice {
    std::string customerId;
    std::string orderId;
    Money amount;
    Timestamp createdAt;
    Timestamp validUntil;
};

} // namespace payment::domain
