#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/secondary/RetryingPaymentGateway.hpp"
#include "mocks/MockHttpPaymentGateway.hpp"
#include "mocks/MockPaymentGateway.hpp"
#include "mocks/RecordingDelayer.hpp"

using namespace payment;
using namespace payment::adapters::secondary;
using namespace payment::tests;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

class RetryingPaymentGatewayTest : public ::testing::Test {
protected:
    void SetUp() override {
        delegate_ = std::make_shared<MockHttpPaymentGateway>();
        delayer_ = std::make_shared<RecordingDelayer>();
        gateway_ = std::make_shared<RetryingPaymentGateway>(
            delegate_, std::make_shared<settings::PaymentSettings>(3, 500, 30), delayer_);

        request_.endpoint = domain::GatewayEndpoint::TERMINAL;
        request_.idempotencyKey = "txn-0001";
        request_.amount = domain::Money::fromDouble(15.0);
        request_.customerId = "user-1";
        request_.orderId = "ord-1";
    }

    std::shared_ptr<MockHttpPaymentGateway> delegate_;
    std::shared_ptr<RecordingDelayer> delayer_;
    std::shared_ptr<RetryingPaymentGateway> gateway_;
    domain::GatewayRequest request_;
};

TEST_F(RetryingPaymentGatewayTest, ApprovedFirstTime_SingleCall) {
    EXPECT_CALL(*delegate_, charge(_)).Times(1).WillOnce(Return(approvedResponse()));

    auto response = gateway_->charge(request_);

    EXPECT_TRUE(response.approved);
    EXPECT_TRUE(delayer_->getDelays().empty());
}

TEST_F(RetryingPaymentGatewayTest, DeclinedThenApproved) {
    EXPECT_CALL(*delegate_, charge(_))
        .WillOnce(Return(declinedResponse()))
        .WillOnce(Return(approvedResponse("ext-2")));

    auto response = gateway_->charge(request_);

    EXPECT_TRUE(response.approved);
    EXPECT_EQ(response.externalTransactionId, "ext-2");
    ASSERT_EQ(delayer_->getDelays().size(), 1u);
    EXPECT_EQ(delayer_->getDelays()[0], std::chrono::milliseconds(500));
}

TEST_F(RetryingPaymentGatewayTest, AllDeclined_ReturnsLastResponse) {
    EXPECT_CALL(*delegate_, charge(_))
        .WillOnce(Return(declinedResponse("first")))
        .WillOnce(Return(declinedResponse("second")))
        .WillOnce(Return(declinedResponse("third")));

    auto response = gateway_->charge(request_);

    EXPECT_FALSE(response.approved);
    EXPECT_EQ(response.message, "third");
    ASSERT_EQ(delayer_->getDelays().size(), 2u);
    EXPECT_EQ(delayer_->getDelays()[1], std::chrono::milliseconds(1000));
}

TEST_F(RetryingPaymentGatewayTest, TransportErrorThenApproved) {
    EXPECT_CALL(*delegate_, charge(_))
        .WillOnce(Throw(domain::GatewayTransportError("timeout")))
        .WillOnce(Return(approvedResponse()));

    EXPECT_TRUE(gateway_->charge(request_).approved);
}

TEST_F(RetryingPaymentGatewayTest, TransportErrorEveryAttempt_Propagates) {
    EXPECT_CALL(*delegate_, charge(_))
        .Times(3)
        .WillRepeatedly(Throw(domain::GatewayTransportError("timeout")));

    EXPECT_THROW(gateway_->charge(request_), domain::GatewayTransportError);
}

TEST_F(RetryingPaymentGatewayTest, NonTransportError_NotRetried) {
    EXPECT_CALL(*delegate_, charge(_))
        .Times(1)
        .WillOnce(Throw(std::invalid_argument("Card details are required")));

    EXPECT_THROW(gateway_->charge(request_), std::invalid_argument);
}
