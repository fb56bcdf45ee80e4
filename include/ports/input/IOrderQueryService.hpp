#pragma once

#include "domain/Order.hpp"
#include "domain/PaymentTransaction.hpp"
#include <string>
#include <vector>

namespace payment::ports::input {

/**
 * @brief Интерфейс чтения истории заказов
 */
class IOrderQueryService {
public:
    virtual ~IOrderQueryService() = default;

    virtual std::vector<domain::Order> getOrders(const std::string& customerId) = 0;

    /**
     * @brief Только PAID и CANCELLED, новые первыми
     */
    virtual std::vector<domain::Order> getOrderHistory(const std::string& customerId) = 0;

    /**
     * @throws domain::NotFoundError, domain::ForbiddenError
     */
    virtual domain::Order getOrder(const std::string& customerId, const std::string& orderId) = 0;

    virtual std::vector<domain::PaymentTransaction> getTransactions(const std::string& customerId,
                                                                    const std::string& orderId) = 0;
};

} // namespace payment::ports::input
