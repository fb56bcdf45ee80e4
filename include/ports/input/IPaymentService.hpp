#pragma once

#include "domain/PaymentRequest.hpp"
#include "domain/PaymentResult.hpp"
#include "domain/PaymentMethod.hpp"
#include <string>
#include <vector>

namespace payment::ports::input {

/**
 * @brief Интерфейс сервиса оплаты заказов
 */
class IPaymentService {
public:
    virtual ~IPaymentService() = default;

    /**
     * @brief Оплатить активную корзину покупателя
     *
     * @throws domain::ValidationError, domain::NotFoundError, domain::ConflictError,
     *         domain::GatewayTransportError
     */
    virtual domain::PaymentResult processPayment(const std::string& customerId,
                                                 const domain::PaymentRequest& request) = 0;

    /**
     * @brief Активные методы оплаты по displayOrder
     */
    virtual std::vector<domain::PaymentMethod> getPaymentMethods() = 0;
};

} // namespace payment::ports::input
