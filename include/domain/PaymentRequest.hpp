#pragma once

#include <string>
#include <optional>

namespace payment::domain {

/**
 * @brief Реквизиты карты (только для метода visa)
 */
struct CardDetails {
    std::string holder;
    std::string cardNumber;
    int monthExpire = 0;
    int yearExpire = 0;
    int cvv2 = 0;
};

/**
 * @brief Запрос на оплату корзины
 */
class PaymentRequest {
public:
    std::string method;
    std::optional<CardDetails> card;

    PaymentRequest() = default;

    explicit PaymentRequest(const std::string& method_)
        : method(method_) {}

    PaymentRequest(const std::string& method_, const CardDetails& card_)
        : method(method_), card(card_) {}
};

} // namespace payment::domain
