#pragma once

#include <string>
#include <optional>
#include <algorithm>
#include <cctype>

namespace payment::domain {

/**
 * @brief Способ расчёта
 *
 * - BANK: асинхронно, по счёту (invoice)
 * - TERMINAL: синхронно, через шлюз /payments/terminal
 * - CARD: синхронно, через шлюз /payments/card
 */
enum class PaymentMethodKind {
    BANK,
    TERMINAL,
    CARD
};

inline std::string normalizeMethodCode(const std::string& code) {
    std::string result = code;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

/**
 * @brief Код метода оплаты → способ расчёта (без учёта регистра)
 */
inline std::optional<PaymentMethodKind> methodKindFromCode(const std::string& code) {
    auto normalized = normalizeMethodCode(code);
    if (normalized == "bank") return PaymentMethodKind::BANK;
    if (normalized == "ibox terminal") return PaymentMethodKind::TERMINAL;
    if (normalized == "visa") return PaymentMethodKind::CARD;
    return std::nullopt;
}

inline std::string toString(PaymentMethodKind kind) {
    switch (kind) {
        case PaymentMethodKind::BANK: return "BANK";
        case PaymentMethodKind::TERMINAL: return "TERMINAL";
        case PaymentMethodKind::CARD: return "CARD";
        default: return "UNKNOWN";
    }
}

} // namespace payment::domain
