#pragma once

#include "domain/PaymentTransaction.hpp"
#include "domain/Money.hpp"
#include "domain/enums/PaymentStatus.hpp"
#include <string>
#include <vector>
#include <optional>

namespace payment::ports::output {

/**
 * @brief Журнал платёжных транзакций
 */
class ITransactionLedger {
public:
    virtual ~ITransactionLedger() = default;

    /**
     * @brief Создать запись о попытке оплаты
     * @return id транзакции
     */
    virtual std::string createTransaction(const std::string& orderId,
                                          const std::string& customerId,
                                          const std::string& paymentMethod,
                                          const domain::Money& amount,
                                          domain::PaymentStatus status) = 0;

    /**
     * @brief Обновить статус; финальные записи (COMPLETED / FAILED) не меняются
     * @return false если транзакции нет или она уже финальная
     */
    virtual bool updateTransactionStatus(const std::string& transactionId,
                                         domain::PaymentStatus status,
                                         const std::optional<std::string>& externalTransactionId = std::nullopt,
                                         const std::optional<std::string>& errorMessage = std::nullopt) = 0;

    virtual std::optional<domain::PaymentTransaction> findById(const std::string& transactionId) = 0;

    /**
     * @brief Транзакции заказа, новые первыми
     */
    virtual std::vector<domain::PaymentTransaction> findByOrderId(const std::string& orderId) = 0;
};

} // namespace payment::ports::output
