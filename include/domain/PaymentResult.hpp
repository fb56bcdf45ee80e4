#pragma once

#include "Money.hpp"
#include "Timestamp.hpp"
#include "enums/PaymentMethodKind.hpp"
#include <string>
#include <optional>

namespace payment::domain {

/**
 * @brief Сгенерированный счёт (метод bank)
 */
struct BankInvoiceDocument {
    std::string document;
    std::string fileName;       // invoice_<orderId>.txt
    Timestamp validUntil;
};

/**
 * @brief Квитанция об оплате через терминал
 */
struct PaymentReceipt {
    std::string customerId;
    std::string orderId;
    Timestamp paymentDate;
    Money sum;
};

/**
 * @brief Результат оплаты
 *
 * success=false означает отказ шлюза (заказ отменён), а не ошибку сервиса.
 */
class PaymentResult {
public:
    bool success = false;
    PaymentMethodKind method = PaymentMethodKind::BANK;
    std::string message;
    std::string orderId;
    std::string transactionId;
    Money amount;
    std::optional<BankInvoiceDocument> invoice;
    std::optional<PaymentReceipt> receipt;
};

} // namespace payment::domain
