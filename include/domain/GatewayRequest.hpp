#pragma once

#include "Money.hpp"
#include "PaymentRequest.hpp"
#include <string>
#include <optional>

namespace payment::domain {

enum class GatewayEndpoint {
    CARD,
    TERMINAL
};

/**
 * @brief Запрос на списание через внешний шлюз
 *
 * idempotencyKey совпадает с id транзакции и не меняется между повторами.
 */
struct GatewayRequest {
    GatewayEndpoint endpoint = GatewayEndpoint::CARD;
    std::string idempotencyKey;
    Money amount;
    std::string customerId;
    std::string orderId;
    std::optional<CardDetails> card;
};

struct GatewayResponse {
    bool approved = false;
    int httpStatus = 0;
    std::string externalTransactionId;
    std::string message;
};

} // namespace payment::domain
