#pragma once

#include "ports/output/IDelayer.hpp"
#include <algorithm>
#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <iostream>

namespace payment::application {

/**
 * @brief Ограниченный повтор операции с задержкой между попытками
 *
 * Семантика execute():
 * - не более maxAttempts попыток;
 * - результат true возвращается сразу;
 * - retryable-исключение на не последней попытке логируется и считается
 *   неудачной попыткой, на последней пробрасывается;
 * - остальные исключения пробрасываются сразу;
 * - все попытки вернули false → false.
 *
 * Перед повтором n (с 1) выполняется delay(delayFunction(n)).
 */
class RetryPolicy {
public:
    using DelayFunction = std::function<std::chrono::milliseconds(int)>;
    using RetryablePredicate = std::function<bool(const std::exception&)>;

    RetryPolicy(
        int maxAttempts,
        DelayFunction delayFunction,
        RetryablePredicate isRetryable,
        std::shared_ptr<ports::output::IDelayer> delayer
    ) : maxAttempts_(maxAttempts)
      , delayFunction_(std::move(delayFunction))
      , isRetryable_(std::move(isRetryable))
      , delayer_(std::move(delayer))
    {
        if (maxAttempts_ < 1) {
            throw std::invalid_argument("RetryPolicy: maxAttempts must be >= 1");
        }
    }

    static constexpr std::chrono::milliseconds MAX_BACKOFF_DELAY{60000};

    /**
     * @brief baseDelay × 2^(n−1), без jitter, не больше maxDelay
     */
    static DelayFunction exponentialBackoff(
        std::chrono::milliseconds baseDelay,
        std::chrono::milliseconds maxDelay = MAX_BACKOFF_DELAY)
    {
        return [baseDelay, maxDelay](int retryNumber) {
            if (baseDelay.count() <= 0) {
                return std::chrono::milliseconds(0);
            }
            auto delay = baseDelay;
            for (int i = 1; i < retryNumber && delay < maxDelay; ++i) {
                delay *= 2;
            }
            return std::min(delay, maxDelay);
        };
    }

    bool execute(const std::function<bool()>& operation) const {
        for (int attempt = 1; attempt <= maxAttempts_; ++attempt) {
            try {
                if (operation()) {
                    return true;
                }
                std::cout << "[RetryPolicy] Attempt " << attempt << "/" << maxAttempts_
                          << " failed" << std::endl;
            } catch (const std::exception& e) {
                if (!isRetryable_(e) || attempt == maxAttempts_) {
                    throw;
                }
                std::cerr << "[RetryPolicy] Attempt " << attempt << "/" << maxAttempts_
                          << " error: " << e.what() << std::endl;
            }

            if (attempt < maxAttempts_) {
                delayer_->delay(delayFunction_(attempt));
            }
        }
        return false;
    }

    int getMaxAttempts() const { return maxAttempts_; }

private:
    int maxAttempts_;
    DelayFunction delayFunction_;
    RetryablePredicate isRetryable_;
    std::shared_ptr<ports::output::IDelayer> delayer_;
};

} // namespace payment::application
