/**
 * @file OrderTest.cpp
 * @brief Unit-тесты для Money, Order и таблицы переходов статуса
 */

#include <gtest/gtest.h>

#include "domain/Order.hpp"
#include "domain/OrderStateMachine.hpp"
#include "domain/enums/PaymentMethodKind.hpp"

using namespace payment;
using namespace payment::domain;

namespace {

OrderLine makeLine(const std::string& key, double price, int64_t quantity, int discount = 0) {
    return OrderLine("ord-1", "game-" + key, key, "Game " + key, quantity,
                     Money::fromDouble(price), discount);
}

} // namespace

// ============================================================================
// ТЕСТЫ: Money
// ============================================================================

TEST(MoneyTest, Addition_IsExact) {
    auto sum = Money::fromDouble(0.1) + Money::fromDouble(0.2);

    EXPECT_EQ(sum, Money::fromDouble(0.3));
    EXPECT_EQ(sum.toString(), "0.30");
}

TEST(MoneyTest, ToString_TwoDecimals) {
    EXPECT_EQ(Money::fromDouble(30.0).toString(), "30.00");
    EXPECT_EQ(Money::fromDouble(19.99).toString(), "19.99");
    EXPECT_EQ(Money::fromDouble(0.005).toString(), "0.01");
    EXPECT_EQ(Money::zero().toString(), "0.00");
}

TEST(MoneyTest, Discounted_AppliesPercent) {
    EXPECT_EQ(Money::fromDouble(40.0).discounted(10), Money::fromDouble(36.0));
    EXPECT_EQ(Money::fromDouble(40.0).discounted(0), Money::fromDouble(40.0));
    EXPECT_TRUE(Money::fromDouble(40.0).discounted(100).isZero());
}

// ============================================================================
// ТЕСТЫ: Order::computeTotal
// ============================================================================

TEST(OrderTotalTest, SumsLines) {
    std::vector<OrderLine> lines = {
        makeLine("witcher", 10.0, 2),
        makeLine("doom", 10.0, 1)
    };

    EXPECT_EQ(Order::computeTotal(lines), Money::fromDouble(30.0));
}

TEST(OrderTotalTest, EmptyCart_IsExactlyZero) {
    auto total = Order::computeTotal({});

    EXPECT_TRUE(total.isZero());
    EXPECT_EQ(total.currency, "USD");
}

TEST(OrderTotalTest, AppliesLineDiscount) {
    std::vector<OrderLine> lines = {
        makeLine("witcher", 20.0, 2, 10),   // 36.00
        makeLine("doom", 5.5, 1)            // 5.50
    };

    EXPECT_EQ(Order::computeTotal(lines).toString(), "41.50");
}

TEST(OrderTotalTest, TotalItems_SumsQuantities) {
    Order order("ord-1", "user-1");
    order.lines = {makeLine("witcher", 10.0, 2), makeLine("doom", 10.0, 3)};

    EXPECT_EQ(order.totalItems(), 5);
    EXPECT_EQ(order.total(), Money::fromDouble(50.0));
}

// ============================================================================
// ТЕСТЫ: OrderStateMachine
// ============================================================================

TEST(OrderStateMachineTest, ValidTransitions) {
    EXPECT_EQ(OrderStateMachine::next(OrderStatus::OPEN, OrderEvent::CHECKOUT_STARTED),
              OrderStatus::CHECKOUT);
    EXPECT_EQ(OrderStateMachine::next(OrderStatus::CHECKOUT, OrderEvent::PAYMENT_SUCCEEDED),
              OrderStatus::PAID);
    EXPECT_EQ(OrderStateMachine::next(OrderStatus::CHECKOUT, OrderEvent::PAYMENT_FAILED),
              OrderStatus::CANCELLED);
}

TEST(OrderStateMachineTest, PaymentOnOpenOrder_Throws) {
    EXPECT_THROW(OrderStateMachine::next(OrderStatus::OPEN, OrderEvent::PAYMENT_SUCCEEDED),
                 InvalidTransitionError);
    EXPECT_THROW(OrderStateMachine::next(OrderStatus::OPEN, OrderEvent::PAYMENT_FAILED),
                 InvalidTransitionError);
}

TEST(OrderStateMachineTest, TerminalStates_RejectEverything) {
    for (auto status : {OrderStatus::PAID, OrderStatus::CANCELLED}) {
        EXPECT_TRUE(OrderStateMachine::isTerminal(status));
        for (auto event : {OrderEvent::CHECKOUT_STARTED, OrderEvent::PAYMENT_SUCCEEDED,
                           OrderEvent::PAYMENT_FAILED}) {
            EXPECT_FALSE(OrderStateMachine::canApply(status, event));
            EXPECT_THROW(OrderStateMachine::next(status, event), InvalidTransitionError);
        }
    }
}

TEST(OrderStateMachineTest, CheckoutTwice_Throws) {
    EXPECT_THROW(OrderStateMachine::next(OrderStatus::CHECKOUT, OrderEvent::CHECKOUT_STARTED),
                 InvalidTransitionError);
}

TEST(OrderStateMachineTest, Apply_SetsFinalizedAtOnTerminal) {
    Order order("ord-1", "user-1");

    order.apply(OrderEvent::CHECKOUT_STARTED);
    EXPECT_EQ(order.status, OrderStatus::CHECKOUT);
    EXPECT_FALSE(order.finalizedAt.has_value());

    order.apply(OrderEvent::PAYMENT_SUCCEEDED);
    EXPECT_EQ(order.status, OrderStatus::PAID);
    EXPECT_TRUE(order.finalizedAt.has_value());
}

// ============================================================================
// ТЕСТЫ: коды методов оплаты
// ============================================================================

TEST(PaymentMethodKindTest, CodesAreCaseInsensitive) {
    EXPECT_TRUE(methodKindFromCode("Bank") == PaymentMethodKind::BANK);
    EXPECT_TRUE(methodKindFromCode("IBOX TERMINAL") == PaymentMethodKind::TERMINAL);
    EXPECT_TRUE(methodKindFromCode("visa") == PaymentMethodKind::CARD);
    EXPECT_FALSE(methodKindFromCode("paypal").has_value());
}
