/**
 * @file HttpServiceClientsTest.cpp
 * @brief Unit-тесты HTTP клиентов к catalog-service и auth-service
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/secondary/HttpCatalogClient.hpp"
#include "adapters/secondary/HttpCustomerDirectory.hpp"
#include "adapters/secondary/HttpAuthClient.hpp"
#include "mocks/MockHttpPaymentGateway.hpp"
#include <SimpleResponse.hpp>

using namespace payment;
using namespace payment::adapters::secondary;
using namespace payment::tests;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

class HttpServiceClientsTest : public ::testing::Test {
protected:
    void SetUp() override {
        mockHttpClient_ = std::make_shared<MockHttpClient>();
        catalog_ = std::make_shared<HttpCatalogClient>(
            mockHttpClient_, std::make_shared<settings::CatalogClientSettings>());
        customers_ = std::make_shared<HttpCustomerDirectory>(
            mockHttpClient_, std::make_shared<settings::AuthClientSettings>());
        auth_ = std::make_shared<HttpAuthClient>(
            mockHttpClient_, std::make_shared<settings::AuthClientSettings>());
    }

    void expectRequest(const std::string& method, const std::string& path,
                       int status, const std::string& body) {
        EXPECT_CALL(*mockHttpClient_, send(_, _))
            .WillOnce([method, path, status, body](const IRequest& req, IResponse& res) {
                EXPECT_EQ(req.getMethod(), method);
                EXPECT_EQ(req.getPath(), path);

                auto& simpleRes = dynamic_cast<SimpleResponse&>(res);
                simpleRes.setStatus(status);
                simpleRes.setBody(body);
                return true;
            });
    }

    std::shared_ptr<MockHttpClient> mockHttpClient_;
    std::shared_ptr<HttpCatalogClient> catalog_;
    std::shared_ptr<HttpCustomerDirectory> customers_;
    std::shared_ptr<HttpAuthClient> auth_;
};

// ============================================================================
// ТЕСТЫ: HttpCatalogClient
// ============================================================================

TEST_F(HttpServiceClientsTest, FindProduct_ParsesSnapshot) {
    expectRequest("GET", "/api/games/witcher", 200, R"({
        "id": "game-1", "key": "witcher", "name": "The Witcher",
        "price": 19.99, "currency": "USD", "discount": 10, "unitInStock": 7
    })");

    auto product = catalog_->findProduct("witcher");

    ASSERT_TRUE(product.has_value());
    EXPECT_EQ(product->productId, "game-1");
    EXPECT_EQ(product->name, "The Witcher");
    EXPECT_EQ(product->price, domain::Money::fromDouble(19.99));
    EXPECT_EQ(product->discount, 10);
    EXPECT_EQ(product->unitsInStock, 7);
}

TEST_F(HttpServiceClientsTest, FindProduct_404_Nullopt) {
    expectRequest("GET", "/api/games/unknown", 404, "");

    EXPECT_FALSE(catalog_->findProduct("unknown").has_value());
}

TEST_F(HttpServiceClientsTest, FindProduct_Unreachable_Throws) {
    EXPECT_CALL(*mockHttpClient_, send(_, _)).WillOnce(Return(false));

    EXPECT_THROW(catalog_->findProduct("witcher"), std::runtime_error);
}

// ============================================================================
// ТЕСТЫ: HttpCustomerDirectory
// ============================================================================

TEST_F(HttpServiceClientsTest, CustomerExists_200_True) {
    expectRequest("GET", "/api/v1/users/user-1", 200, R"({"id":"user-1"})");

    EXPECT_TRUE(customers_->exists("user-1"));
}

TEST_F(HttpServiceClientsTest, CustomerExists_404_False) {
    expectRequest("GET", "/api/v1/users/ghost", 404, "");

    EXPECT_FALSE(customers_->exists("ghost"));
}

TEST_F(HttpServiceClientsTest, CustomerExists_500_Throws) {
    expectRequest("GET", "/api/v1/users/user-1", 500, "");

    EXPECT_THROW(customers_->exists("user-1"), std::runtime_error);
}

// ============================================================================
// ТЕСТЫ: HttpAuthClient
// ============================================================================

TEST_F(HttpServiceClientsTest, ValidToken_ReturnsCustomerId) {
    expectRequest("POST", "/api/v1/auth/validate", 200,
                  R"({"valid": true, "user_id": "user-1", "message": "OK"})");

    EXPECT_EQ(auth_->getCustomerIdFromToken("token-1").value_or(""), "user-1");
}

TEST_F(HttpServiceClientsTest, InvalidToken_Nullopt) {
    expectRequest("POST", "/api/v1/auth/validate", 200,
                  R"({"valid": false, "message": "Token expired"})");

    EXPECT_FALSE(auth_->getCustomerIdFromToken("token-1").has_value());
}

TEST_F(HttpServiceClientsTest, AuthUnreachable_NotValid) {
    EXPECT_CALL(*mockHttpClient_, send(_, _)).WillOnce(Return(false));

    auto result = auth_->validateAccessToken("token-1");

    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.message, "Auth service unreachable");
}

TEST_F(HttpServiceClientsTest, ValidToken_SubClaimFallback) {
    expectRequest("POST", "/api/v1/auth/validate", 200,
                  R"({"valid": true, "user_id": "", "sub": "user-7"})");

    EXPECT_EQ(auth_->getCustomerIdFromToken("token-1").value_or(""), "user-7");
}

TEST_F(HttpServiceClientsTest, ValidToken_NumericUserId) {
    expectRequest("POST", "/api/v1/auth/validate", 200,
                  R"({"valid": true, "user_id": 42})");

    EXPECT_EQ(auth_->getCustomerIdFromToken("token-1").value_or(""), "42");
}

TEST_F(HttpServiceClientsTest, ValidToken_WithoutCustomerId_Nullopt) {
    expectRequest("POST", "/api/v1/auth/validate", 200, R"({"valid": true})");

    EXPECT_FALSE(auth_->getCustomerIdFromToken("token-1").has_value());
}

TEST_F(HttpServiceClientsTest, Auth401_Rejected) {
    expectRequest("POST", "/api/v1/auth/validate", 401, "");

    auto result = auth_->validateAccessToken("token-1");

    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.message, "Token rejected by auth service");
}

TEST_F(HttpServiceClientsTest, AuthMalformedBody_NotValid) {
    expectRequest("POST", "/api/v1/auth/validate", 200, "<html>oops</html>");

    auto result = auth_->validateAccessToken("token-1");

    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.message, "Malformed auth service response");
}

TEST_F(HttpServiceClientsTest, AuthValidFlagNotBoolean_NotValid) {
    expectRequest("POST", "/api/v1/auth/validate", 200,
                  R"({"valid": "yes", "user_id": "user-1"})");

    EXPECT_FALSE(auth_->getCustomerIdFromToken("token-1").has_value());
}

TEST_F(HttpServiceClientsTest, AuthClientThrows_NotValid) {
    EXPECT_CALL(*mockHttpClient_, send(_, _))
        .WillOnce(Throw(std::runtime_error("connection reset")));

    auto result = auth_->validateAccessToken("token-1");

    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.message, "Auth service error: connection reset");
}

TEST_F(HttpServiceClientsTest, CustomPaths_UsedForAuthAndUsers) {
    auto settings = std::make_shared<settings::AuthClientSettings>(
        "auth-internal", 9090, "/internal/validate", "/internal/users/");
    HttpAuthClient auth(mockHttpClient_, settings);
    HttpCustomerDirectory customers(mockHttpClient_, settings);

    EXPECT_CALL(*mockHttpClient_, send(_, _))
        .WillOnce([](const IRequest& req, IResponse& res) {
            EXPECT_EQ(req.getPath(), "/internal/validate");
            dynamic_cast<SimpleResponse&>(res).setStatus(200);
            dynamic_cast<SimpleResponse&>(res).setBody(R"({"valid": true, "user_id": "user-1"})");
            return true;
        })
        .WillOnce([](const IRequest& req, IResponse& res) {
            EXPECT_EQ(req.getPath(), "/internal/users/user-1");
            dynamic_cast<SimpleResponse&>(res).setStatus(200);
            return true;
        });

    EXPECT_TRUE(auth.validateAccessToken("token-1").valid);
    EXPECT_TRUE(customers.exists("user-1"));
}
