#pragma once

#include "ports/output/IPaymentGateway.hpp"
#include "ports/output/IDelayer.hpp"
#include "adapters/secondary/HttpPaymentGateway.hpp"
#include "application/RetryPolicy.hpp"
#include "settings/PaymentSettings.hpp"
#include "domain/Errors.hpp"
#include <memory>
#include <iostream>

namespace payment::adapters::secondary {

/**
 * @brief Декоратор IPaymentGateway с повторами
 *
 * Повторяет отказ и GatewayTransportError с экспоненциальной задержкой.
 * Запрос (и X-Idempotency-Key) одинаковый на всех попытках.
 * Если все попытки закончились отказом, возвращается последний ответ шлюза.
 */
class RetryingPaymentGateway : public ports::output::IPaymentGateway {
public:
    RetryingPaymentGateway(
        std::shared_ptr<HttpPaymentGateway> delegate,
        std::shared_ptr<settings::PaymentSettings> settings,
        std::shared_ptr<ports::output::IDelayer> delayer
    ) : delegate_(std::move(delegate))
      , policy_(
            settings->getRetryAttempts(),
            application::RetryPolicy::exponentialBackoff(
                std::chrono::milliseconds(settings->getRetryDelayMs())),
            [](const std::exception& e) {
                return dynamic_cast<const domain::GatewayTransportError*>(&e) != nullptr;
            },
            std::move(delayer))
    {
        std::cout << "[RetryingPaymentGateway] Created with:"
                  << " attempts=" << settings->getRetryAttempts()
                  << " baseDelay=" << settings->getRetryDelayMs() << "ms" << std::endl;
    }

    domain::GatewayResponse charge(const domain::GatewayRequest& request) override {
        domain::GatewayResponse last;
        int attempts = 0;

        bool approved = policy_.execute([&]() {
            ++attempts;
            last = delegate_->charge(request);
            return last.approved;
        });

        if (!approved) {
            std::cout << "[RetryingPaymentGateway] Order " << request.orderId
                      << " declined after " << attempts << " attempt(s)" << std::endl;
        }
        return last;
    }

private:
    std::shared_ptr<HttpPaymentGateway> delegate_;
    application::RetryPolicy policy_;
};

} // namespace payment::adapters::secondary
