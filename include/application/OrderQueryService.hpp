#pragma once

#include "ports/input/IOrderQueryService.hpp"
#include "ports/output/IOrderStore.hpp"
#include "ports/output/ITransactionLedger.hpp"
#include "domain/Errors.hpp"
#include <memory>
#include <iostream>

namespace payment::application {

/**
 * @brief Чтение заказов и транзакций покупателя
 */
class OrderQueryService : public ports::input::IOrderQueryService {
public:
    OrderQueryService(
        std::shared_ptr<ports::output::IOrderStore> orderStore,
        std::shared_ptr<ports::output::ITransactionLedger> ledger
    ) : orderStore_(std::move(orderStore))
      , ledger_(std::move(ledger))
    {
        std::cout << "[OrderQueryService] Created" << std::endl;
    }

    std::vector<domain::Order> getOrders(const std::string& customerId) override {
        return orderStore_->findByCustomer(customerId);
    }

    std::vector<domain::Order> getOrderHistory(const std::string& customerId) override {
        std::vector<domain::Order> result;
        for (auto& order : orderStore_->findByCustomer(customerId)) {
            if (order.status == domain::OrderStatus::PAID ||
                order.status == domain::OrderStatus::CANCELLED) {
                result.push_back(std::move(order));
            }
        }
        return result;
    }

    domain::Order getOrder(const std::string& customerId, const std::string& orderId) override {
        auto order = orderStore_->findById(orderId);
        if (!order) {
            throw domain::NotFoundError("Order not found: " + orderId);
        }
        if (order->customerId != customerId) {
            std::cout << "[OrderQueryService] Customer " << customerId
                      << " denied access to order " << orderId << std::endl;
            throw domain::ForbiddenError("Order " + orderId + " belongs to another customer");
        }
        return *order;
    }

    std::vector<domain::PaymentTransaction> getTransactions(
        const std::string& customerId, const std::string& orderId) override
    {
        auto order = getOrder(customerId, orderId);
        return ledger_->findByOrderId(order.id);
    }

private:
    std::shared_ptr<ports::output::IOrderStore> orderStore_;
    std::shared_ptr<ports::output::ITransactionLedger> ledger_;
};

} // namespace payment::application
