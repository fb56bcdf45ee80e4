#pragma once

#include <string>

namespace payment::domain {

enum class PaymentStatus {
    PENDING,
    PROCESSING,
    COMPLETED,
    FAILED
};

inline std::string toString(PaymentStatus status) {
    switch (status) {
        case PaymentStatus::PENDING: return "PENDING";
        case PaymentStatus::PROCESSING: return "PROCESSING";
        case PaymentStatus::COMPLETED: return "COMPLETED";
        case PaymentStatus::FAILED: return "FAILED";
        default: return "UNKNOWN";
    }
}

inline PaymentStatus parsePaymentStatus(const std::string& str) {
    if (str == "PROCESSING") return PaymentStatus::PROCESSING;
    if (str == "COMPLETED") return PaymentStatus::COMPLETED;
    if (str == "FAILED") return PaymentStatus::FAILED;
    return PaymentStatus::PENDING;
}

/**
 * @brief Финальный статус: после него транзакция не меняется
 */
inline bool isFinal(PaymentStatus status) {
    return status == PaymentStatus::COMPLETED || status == PaymentStatus::FAILED;
}

} // namespace payment::domain
