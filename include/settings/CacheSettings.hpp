#pragma once

#include <cstdlib>
#include <string>

namespace payment::settings {

/**
 * @brief Настройки кэширования справочника методов оплаты
 *
 * Читает из ENV:
 * - CACHE_PAYMENT_METHOD_SIZE (default: 64)
 * - CACHE_PAYMENT_METHOD_TTL_SECONDS (default: 300)
 */
class CacheSettings {
public:
    CacheSettings() {
        if (const char* val = std::getenv("CACHE_PAYMENT_METHOD_SIZE")) {
            paymentMethodCacheSize_ = static_cast<size_t>(std::stoi(val));
        }
        if (const char* val = std::getenv("CACHE_PAYMENT_METHOD_TTL_SECONDS")) {
            paymentMethodTtlSeconds_ = std::stoi(val);
        }
    }

    CacheSettings(size_t size, int ttlSeconds)
        : paymentMethodCacheSize_(size)
        , paymentMethodTtlSeconds_(ttlSeconds)
    {}

    size_t getPaymentMethodCacheSize() const { return paymentMethodCacheSize_; }
    int getPaymentMethodTtlSeconds() const { return paymentMethodTtlSeconds_; }

private:
    size_t paymentMethodCacheSize_ = 64;
    int paymentMethodTtlSeconds_ = 300;
};

} // namespace payment::settings
