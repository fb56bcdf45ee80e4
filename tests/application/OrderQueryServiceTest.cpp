/**
 * @file OrderQueryServiceTest.cpp
 * @brief Unit-тесты для OrderQueryService
 */

#include <gtest/gtest.h>

#include "application/OrderQueryService.hpp"
#include "adapters/secondary/persistence/InMemoryOrderStore.hpp"
#include "adapters/secondary/persistence/InMemoryTransactionLedger.hpp"

using namespace payment;
using namespace payment::application;
using namespace payment::adapters::secondary;

class OrderQueryServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        orderStore_ = std::make_shared<InMemoryOrderStore>();
        ledger_ = std::make_shared<InMemoryTransactionLedger>();
        queryService_ = std::make_shared<OrderQueryService>(orderStore_, ledger_);
    }

    std::string createOrder(const std::string& customerId, domain::OrderStatus finalStatus) {
        auto order = orderStore_->getOrCreateOpenOrder(customerId);
        orderStore_->upsertLine(domain::OrderLine(order.id, "game-1", "witcher", "The Witcher",
                                                  1, domain::Money::fromDouble(10.0), 0));
        if (finalStatus != domain::OrderStatus::OPEN) {
            orderStore_->setOrderStatus(order.id, domain::OrderStatus::CHECKOUT);
        }
        if (domain::OrderStateMachine::isTerminal(finalStatus)) {
            orderStore_->setOrderStatus(order.id, finalStatus);
        }
        return order.id;
    }

    std::shared_ptr<InMemoryOrderStore> orderStore_;
    std::shared_ptr<InMemoryTransactionLedger> ledger_;
    std::shared_ptr<OrderQueryService> queryService_;
};

TEST_F(OrderQueryServiceTest, GetOrders_NewestFirst) {
    auto paid = createOrder("user-1", domain::OrderStatus::PAID);
    auto open = createOrder("user-1", domain::OrderStatus::OPEN);
    createOrder("user-2", domain::OrderStatus::PAID);

    auto orders = queryService_->getOrders("user-1");

    ASSERT_EQ(orders.size(), 2u);
    EXPECT_EQ(orders[0].id, open);
    EXPECT_EQ(orders[1].id, paid);
}

TEST_F(OrderQueryServiceTest, GetOrderHistory_OnlyFinalized) {
    auto paid = createOrder("user-1", domain::OrderStatus::PAID);
    auto cancelled = createOrder("user-1", domain::OrderStatus::CANCELLED);
    auto checkout = createOrder("user-1", domain::OrderStatus::CHECKOUT);
    createOrder("user-1", domain::OrderStatus::OPEN);

    auto history = queryService_->getOrderHistory("user-1");

    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].id, cancelled);
    EXPECT_EQ(history[1].id, paid);
    for (const auto& order : history) {
        EXPECT_NE(order.id, checkout);
        EXPECT_TRUE(order.finalizedAt.has_value());
    }
}

TEST_F(OrderQueryServiceTest, GetOrder_OtherCustomer_Forbidden) {
    auto orderId = createOrder("user-1", domain::OrderStatus::PAID);

    EXPECT_THROW(queryService_->getOrder("user-2", orderId), domain::ForbiddenError);
}

TEST_F(OrderQueryServiceTest, GetOrder_Unknown_NotFound) {
    EXPECT_THROW(queryService_->getOrder("user-1", "ord-missing"), domain::NotFoundError);
}

TEST_F(OrderQueryServiceTest, GetOrder_IncludesLines) {
    auto orderId = createOrder("user-1", domain::OrderStatus::PAID);

    auto order = queryService_->getOrder("user-1", orderId);

    ASSERT_EQ(order.lines.size(), 1u);
    EXPECT_EQ(order.total(), domain::Money::fromDouble(10.0));
}

TEST_F(OrderQueryServiceTest, GetTransactions_ReturnsAttemptsForOrder) {
    auto orderId = createOrder("user-1", domain::OrderStatus::CANCELLED);
    auto txId = ledger_->createTransaction(orderId, "user-1", "visa",
                                           domain::Money::fromDouble(10.0),
                                           domain::PaymentStatus::PROCESSING);
    ASSERT_TRUE(ledger_->updateTransactionStatus(txId, domain::PaymentStatus::FAILED,
                                                 std::nullopt, std::string("Declined")));

    auto transactions = queryService_->getTransactions("user-1", orderId);

    ASSERT_EQ(transactions.size(), 1u);
    EXPECT_EQ(transactions[0].id, txId);
    EXPECT_EQ(transactions[0].status, domain::PaymentStatus::FAILED);
    EXPECT_EQ(transactions[0].errorMessage.value_or(""), "Declined");
}

TEST_F(OrderQueryServiceTest, GetTransactions_OtherCustomer_Forbidden) {
    auto orderId = createOrder("user-1", domain::OrderStatus::PAID);

    EXPECT_THROW(queryService_->getTransactions("user-2", orderId), domain::ForbiddenError);
}
