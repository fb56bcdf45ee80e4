#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>

namespace payment::settings {

/**
 * @brief Настройки оплаты
 *
 * Читает из ENV:
 * - PAYMENT_RETRY_ATTEMPTS (default: 3, от 1 до 10)
 * - PAYMENT_RETRY_DELAY_MS (default: 1000, до 60000), база экспоненциальной задержки
 * - PAYMENT_INVOICE_VALIDITY_DAYS (default: 30)
 * - PAYMENT_STORAGE (default: "postgres", или "memory")
 *
 * Некорректные значения → std::invalid_argument при старте.
 */
class PaymentSettings {
public:
    PaymentSettings() {
        if (const char* val = std::getenv("PAYMENT_RETRY_ATTEMPTS")) {
            retryAttempts_ = std::stoi(val);
        }
        if (const char* val = std::getenv("PAYMENT_RETRY_DELAY_MS")) {
            retryDelayMs_ = std::stoi(val);
        }
        if (const char* val = std::getenv("PAYMENT_INVOICE_VALIDITY_DAYS")) {
            invoiceValidityDays_ = std::stoi(val);
        }
        if (const char* val = std::getenv("PAYMENT_STORAGE")) {
            storage_ = val;
        }
        validate();
    }

    PaymentSettings(int retryAttempts, int retryDelayMs, int invoiceValidityDays,
                    const std::string& storage = "memory")
        : retryAttempts_(retryAttempts)
        , retryDelayMs_(retryDelayMs)
        , invoiceValidityDays_(invoiceValidityDays)
        , storage_(storage)
    {
        validate();
    }

    int getRetryAttempts() const { return retryAttempts_; }
    int getRetryDelayMs() const { return retryDelayMs_; }
    int getInvoiceValidityDays() const { return invoiceValidityDays_; }
    std::string getStorage() const { return storage_; }
    bool useInMemoryStorage() const { return storage_ == "memory"; }

private:
    int retryAttempts_ = 3;
    int retryDelayMs_ = 1000;
    int invoiceValidityDays_ = 30;
    std::string storage_ = "postgres";

    static constexpr int MAX_RETRY_ATTEMPTS = 10;
    static constexpr int MAX_RETRY_DELAY_MS = 60000;

    void validate() const {
        if (retryAttempts_ < 1 || retryAttempts_ > MAX_RETRY_ATTEMPTS) {
            throw std::invalid_argument("PAYMENT_RETRY_ATTEMPTS must be between 1 and 10");
        }
        if (retryDelayMs_ < 0 || retryDelayMs_ > MAX_RETRY_DELAY_MS) {
            throw std::invalid_argument("PAYMENT_RETRY_DELAY_MS must be between 0 and 60000");
        }
        if (invoiceValidityDays_ < 0) {
            throw std::invalid_argument("PAYMENT_INVOICE_VALIDITY_DAYS must be >= 0");
        }
        if (storage_ != "postgres" && storage_ != "memory") {
            throw std::invalid_argument("PAYMENT_STORAGE must be 'postgres' or 'memory'");
        }
    }
};

} // namespace payment::settings
