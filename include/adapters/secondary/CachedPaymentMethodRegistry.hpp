#pragma once

#include "ports/output/IPaymentMethodRegistry.hpp"
#include "domain/enums/PaymentMethodKind.hpp"
#include "settings/CacheSettings.hpp"
#include <cache/ICache.hpp>
#include <cache/Cache.hpp>
#include <cache/eviction/LRUPolicy.hpp>
#include <cache/expiration/GlobalTTL.hpp>
#include <cache/concurrency/ThreadSafeCache.hpp>
#include <memory>
#include <iostream>

namespace payment::adapters::secondary {

/**
 * @brief Декоратор IPaymentMethodRegistry с LRU кэшированием
 *
 * Кэш: "active" -> список активных методов (справочник меняется редко).
 * isMethodActive() отвечает по тому же закэшированному списку.
 */
class CachedPaymentMethodRegistry : public ports::output::IPaymentMethodRegistry {
public:
    CachedPaymentMethodRegistry(
        std::shared_ptr<ports::output::IPaymentMethodRegistry> delegate,
        std::shared_ptr<settings::CacheSettings> cacheSettings
    ) : delegate_(std::move(delegate))
      , cacheSettings_(std::move(cacheSettings))
    {
        initCache();
    }

    bool isMethodActive(const std::string& code) override {
        auto normalized = domain::normalizeMethodCode(code);
        for (const auto& method : listActiveMethods()) {
            if (domain::normalizeMethodCode(method.code) == normalized) {
                return true;
            }
        }
        return false;
    }

    std::vector<domain::PaymentMethod> listActiveMethods() override {
        auto cached = methodCache_->get(ACTIVE_KEY);
        if (cached) {
            return *cached;
        }

        auto methods = delegate_->listActiveMethods();
        methodCache_->put(ACTIVE_KEY, methods);
        return methods;
    }

    void clearCache() {
        methodCache_->clear();
    }

    size_t getCacheSize() const {
        return methodCache_->size();
    }

private:
    static constexpr const char* ACTIVE_KEY = "active";

    void initCache() {
        size_t cacheSize = cacheSettings_->getPaymentMethodCacheSize();
        int ttlSeconds = cacheSettings_->getPaymentMethodTtlSeconds();

        auto base = std::make_unique<Cache<std::string, std::vector<domain::PaymentMethod>>>(
            cacheSize,
            std::make_unique<LRUPolicy<std::string>>(),
            std::make_unique<GlobalTTL<std::string>>(std::chrono::seconds(ttlSeconds))
        );
        methodCache_ = std::make_unique<ThreadSafeCache<std::string, std::vector<domain::PaymentMethod>>>(
            std::move(base)
        );

        std::cout << "[CachedPaymentMethodRegistry] Created with:"
                  << " size=" << cacheSize << " ttl=" << ttlSeconds << "s" << std::endl;
    }

    std::shared_ptr<ports::output::IPaymentMethodRegistry> delegate_;
    std::shared_ptr<settings::CacheSettings> cacheSettings_;
    std::unique_ptr<ICache<std::string, std::vector<domain::PaymentMethod>>> methodCache_;
};

} // namespace payment::adapters::secondary
