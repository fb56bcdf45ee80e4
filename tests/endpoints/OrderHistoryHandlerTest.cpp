/**
 * @file OrderHistoryHandlerTest.cpp
 * @brief Unit-тесты для OrderHistoryHandler
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/primary/OrderHistoryHandler.hpp"

#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>

using namespace payment;
using namespace payment::adapters::primary;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

class MockOrderQueryService : public ports::input::IOrderQueryService {
public:
    MOCK_METHOD(std::vector<domain::Order>, getOrders, (const std::string&), (override));
    MOCK_METHOD(std::vector<domain::Order>, getOrderHistory, (const std::string&), (override));
    MOCK_METHOD(domain::Order, getOrder, (const std::string&, const std::string&), (override));
    MOCK_METHOD(std::vector<domain::PaymentTransaction>, getTransactions,
                (const std::string&, const std::string&), (override));
};

class OrderHistoryHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        mockService_ = std::make_shared<MockOrderQueryService>();
        handler_ = std::make_unique<OrderHistoryHandler>(mockService_);
    }

    SimpleRequest createRequest(const std::string& path) {
        SimpleRequest req;
        req.setMethod("GET");
        req.setPath(path);
        req.setAttribute("customerId", "user-1");
        return req;
    }

    static domain::Order paidOrder() {
        domain::Order order("ord-1", "user-1");
        order.lines.push_back(domain::OrderLine("ord-1", "game-1", "witcher", "The Witcher", 3,
                                                domain::Money::fromDouble(10.0), 0));
        order.updateStatus(domain::OrderStatus::PAID);
        return order;
    }

    nlohmann::json parseJson(const std::string& body) {
        return nlohmann::json::parse(body);
    }

    std::shared_ptr<MockOrderQueryService> mockService_;
    std::unique_ptr<OrderHistoryHandler> handler_;
};

TEST_F(OrderHistoryHandlerTest, GetOrders_ReturnsList) {
    EXPECT_CALL(*mockService_, getOrders("user-1"))
        .WillOnce(Return(std::vector<domain::Order>{paidOrder()}));

    auto req = createRequest("/api/orders");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto json = parseJson(res.getBody());
    ASSERT_EQ(json["orders"].size(), 1u);
    EXPECT_EQ(json["orders"][0]["id"], "ord-1");
    EXPECT_EQ(json["orders"][0]["status"], "PAID");
    EXPECT_DOUBLE_EQ(json["orders"][0]["total"].get<double>(), 30.0);
    EXPECT_TRUE(json["orders"][0].contains("date"));
}

TEST_F(OrderHistoryHandlerTest, GetHistory_CallsHistory) {
    EXPECT_CALL(*mockService_, getOrderHistory("user-1"))
        .WillOnce(Return(std::vector<domain::Order>{}));
    EXPECT_CALL(*mockService_, getOrder(_, _)).Times(0);

    auto req = createRequest("/api/orders/history");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_TRUE(parseJson(res.getBody())["orders"].empty());
}

TEST_F(OrderHistoryHandlerTest, GetOrder_IncludesLines) {
    EXPECT_CALL(*mockService_, getOrder("user-1", "ord-1")).WillOnce(Return(paidOrder()));

    auto req = createRequest("/api/orders/ord-1");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto json = parseJson(res.getBody());
    ASSERT_EQ(json["lines"].size(), 1u);
    EXPECT_EQ(json["lines"][0]["quantity"], 3);
}

TEST_F(OrderHistoryHandlerTest, GetOrder_OtherCustomer_Returns403) {
    EXPECT_CALL(*mockService_, getOrder("user-1", "ord-9"))
        .WillOnce(Throw(domain::ForbiddenError("Order ord-9 belongs to another customer")));

    auto req = createRequest("/api/orders/ord-9");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 403);
}

TEST_F(OrderHistoryHandlerTest, GetOrder_Unknown_Returns404) {
    EXPECT_CALL(*mockService_, getOrder("user-1", "ord-x"))
        .WillOnce(Throw(domain::NotFoundError("Order not found: ord-x")));

    auto req = createRequest("/api/orders/ord-x");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 404);
}

TEST_F(OrderHistoryHandlerTest, GetTransactions_ReturnsAttempts) {
    domain::PaymentTransaction tx;
    tx.id = "txn-1";
    tx.orderId = "ord-1";
    tx.paymentMethod = "visa";
    tx.amount = domain::Money::fromDouble(30.0);
    tx.status = domain::PaymentStatus::FAILED;
    tx.errorMessage = "Insufficient funds";

    EXPECT_CALL(*mockService_, getTransactions("user-1", "ord-1"))
        .WillOnce(Return(std::vector<domain::PaymentTransaction>{tx}));

    auto req = createRequest("/api/orders/ord-1/transactions");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto json = parseJson(res.getBody());
    ASSERT_EQ(json["transactions"].size(), 1u);
    EXPECT_EQ(json["transactions"][0]["status"], "FAILED");
    EXPECT_EQ(json["transactions"][0]["errorMessage"], "Insufficient funds");
    EXPECT_FALSE(json["transactions"][0].contains("externalTransactionId"));
}

TEST_F(OrderHistoryHandlerTest, PostMethod_Returns405) {
    auto req = createRequest("/api/orders");
    req.setMethod("POST");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 405);
}
