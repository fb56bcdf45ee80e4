#pragma once

#include <IResponse.hpp>
#include "domain/Errors.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <sstream>
#include <vector>

namespace payment::adapters::primary {

inline void sendError(IResponse& res, int status, const std::string& message) {
    nlohmann::json error;
    error["error"] = message;
    res.setResult(status, "application/json", error.dump());
}

/**
 * @brief Код ответа для доменной ошибки
 */
inline int httpStatusFor(const domain::PaymentServiceError& e) {
    if (dynamic_cast<const domain::ValidationError*>(&e)) return 400;
    if (dynamic_cast<const domain::ForbiddenError*>(&e)) return 403;
    if (dynamic_cast<const domain::NotFoundError*>(&e)) return 404;
    if (dynamic_cast<const domain::ConflictError*>(&e)) return 409;
    if (dynamic_cast<const domain::InvalidTransitionError*>(&e)) return 409;
    if (dynamic_cast<const domain::GatewayTransportError*>(&e)) return 502;
    return 500;
}

/**
 * @brief "/api/orders/cart/key?x=1" → {"api", "orders", "cart", "key"}
 */
inline std::vector<std::string> splitPath(const std::string& fullPath) {
    std::string path = fullPath.substr(0, fullPath.find('?'));

    std::vector<std::string> segments;
    std::stringstream ss(path);
    std::string segment;
    while (std::getline(ss, segment, '/')) {
        if (!segment.empty()) {
            segments.push_back(segment);
        }
    }
    return segments;
}

} // namespace payment::adapters::primary
