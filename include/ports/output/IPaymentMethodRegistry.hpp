#pragma once

#include "domain/PaymentMethod.hpp"
#include <string>
#include <vector>

namespace payment::ports::output {

/**
 * @brief Справочник методов оплаты (только чтение)
 */
class IPaymentMethodRegistry {
public:
    virtual ~IPaymentMethodRegistry() = default;

    /**
     * @brief Метод существует и активен (код без учёта регистра)
     */
    virtual bool isMethodActive(const std::string& code) = 0;

    /**
     * @brief Активные методы, упорядоченные по displayOrder
     */
    virtual std::vector<domain::PaymentMethod> listActiveMethods() = 0;
};

} // namespace payment::ports::output
