/**
 * @file CartHandlerTest.cpp
 * @brief Unit-тесты для CartHandler
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/primary/CartHandler.hpp"

#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>

using namespace payment;
using namespace payment::adapters::primary;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

class MockCartService : public ports::input::ICartService {
public:
    MOCK_METHOD(void, addItem, (const std::string&, const std::string&, int64_t), (override));
    MOCK_METHOD(void, updateQuantity, (const std::string&, const std::string&, int64_t), (override));
    MOCK_METHOD(void, removeItem, (const std::string&, const std::string&), (override));
    MOCK_METHOD(std::vector<domain::OrderLine>, getCart, (const std::string&), (override));
    MOCK_METHOD(void, clearCart, (const std::string&), (override));
};

class CartHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        mockService_ = std::make_shared<MockCartService>();
        handler_ = std::make_unique<CartHandler>(mockService_);
    }

    SimpleRequest createRequest(const std::string& method, const std::string& path,
                                const std::string& body = "") {
        SimpleRequest req;
        req.setMethod(method);
        req.setPath(path);
        req.setBody(body);
        req.setAttribute("customerId", "user-1");
        return req;
    }

    nlohmann::json parseJson(const std::string& body) {
        return nlohmann::json::parse(body);
    }

    std::shared_ptr<MockCartService> mockService_;
    std::unique_ptr<CartHandler> handler_;
};

// ============================================================================
// ТЕСТЫ: POST /api/games/{key}/buy
// ============================================================================

TEST_F(CartHandlerTest, Buy_WithoutBody_AddsOne) {
    EXPECT_CALL(*mockService_, addItem("user-1", "witcher", 1)).Times(1);

    auto req = createRequest("POST", "/api/games/witcher/buy");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_EQ(parseJson(res.getBody())["message"], "Game added to cart");
}

TEST_F(CartHandlerTest, Buy_WithQuantity) {
    EXPECT_CALL(*mockService_, addItem("user-1", "witcher", 3)).Times(1);

    auto req = createRequest("POST", "/api/games/witcher/buy", R"({"quantity": 3})");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
}

TEST_F(CartHandlerTest, Buy_OutOfStock_Returns400) {
    EXPECT_CALL(*mockService_, addItem(_, _, _))
        .WillOnce(Throw(domain::ValidationError("Insufficient stock for witcher")));

    auto req = createRequest("POST", "/api/games/witcher/buy");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}

TEST_F(CartHandlerTest, Buy_UnknownGame_Returns404) {
    EXPECT_CALL(*mockService_, addItem(_, _, _))
        .WillOnce(Throw(domain::NotFoundError("Game not found: nope")));

    auto req = createRequest("POST", "/api/games/nope/buy");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 404);
}

// ============================================================================
// ТЕСТЫ: GET / DELETE /api/orders/cart
// ============================================================================

TEST_F(CartHandlerTest, GetCart_ReturnsItemsAndTotal) {
    std::vector<domain::OrderLine> lines = {
        domain::OrderLine("ord-1", "game-1", "witcher", "The Witcher", 2,
                          domain::Money::fromDouble(10.0), 0),
        domain::OrderLine("ord-1", "game-2", "doom", "Doom", 1,
                          domain::Money::fromDouble(20.0), 50)
    };
    EXPECT_CALL(*mockService_, getCart("user-1")).WillOnce(Return(lines));

    auto req = createRequest("GET", "/api/orders/cart");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto json = parseJson(res.getBody());
    ASSERT_EQ(json["items"].size(), 2u);
    EXPECT_EQ(json["items"][0]["key"], "witcher");
    EXPECT_EQ(json["items"][1]["discount"], 50);
    EXPECT_DOUBLE_EQ(json["total"].get<double>(), 30.0);
}

TEST_F(CartHandlerTest, GetCart_Empty_ZeroTotal) {
    EXPECT_CALL(*mockService_, getCart("user-1"))
        .WillOnce(Return(std::vector<domain::OrderLine>{}));

    auto req = createRequest("GET", "/api/orders/cart");
    SimpleResponse res;

    handler_->handle(req, res);

    auto json = parseJson(res.getBody());
    EXPECT_TRUE(json["items"].empty());
    EXPECT_DOUBLE_EQ(json["total"].get<double>(), 0.0);
}

TEST_F(CartHandlerTest, DeleteCart_Clears) {
    EXPECT_CALL(*mockService_, clearCart("user-1")).Times(1);

    auto req = createRequest("DELETE", "/api/orders/cart");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
}

// ============================================================================
// ТЕСТЫ: позиции корзины
// ============================================================================

TEST_F(CartHandlerTest, DeleteItem_RemovesByKey) {
    EXPECT_CALL(*mockService_, removeItem("user-1", "doom")).Times(1);

    auto req = createRequest("DELETE", "/api/orders/cart/doom");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
}

TEST_F(CartHandlerTest, UpdateQuantity_PassesValue) {
    EXPECT_CALL(*mockService_, updateQuantity("user-1", "doom", 4)).Times(1);

    auto req = createRequest("PUT", "/api/orders/cart/doom/quantity", R"({"quantity": 4})");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
}

TEST_F(CartHandlerTest, UpdateQuantity_MissingField_Returns400) {
    EXPECT_CALL(*mockService_, updateQuantity(_, _, _)).Times(0);

    auto req = createRequest("PUT", "/api/orders/cart/doom/quantity", R"({})");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}

TEST_F(CartHandlerTest, CartInCheckout_Returns409) {
    EXPECT_CALL(*mockService_, removeItem(_, _))
        .WillOnce(Throw(domain::ConflictError("Order ord-1 is not open")));

    auto req = createRequest("DELETE", "/api/orders/cart/doom");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 409);
}

TEST_F(CartHandlerTest, UnknownRoute_Returns404) {
    auto req = createRequest("PATCH", "/api/orders/cart");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 404);
}
