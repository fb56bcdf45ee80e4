#pragma once

#include "ports/output/IAuthClient.hpp"
#include <map>
#include <string>

namespace payment::tests {

/**
 * @brief Mock реализация IAuthClient для тестов
 */
class MockAuthClient : public ports::output::IAuthClient {
public:
    void addValidToken(const std::string& token, const std::string& customerId) {
        validTokens_[token] = customerId;
    }

    int validateCallCount() const { return validateCallCount_; }

    ports::output::TokenValidationResult validateAccessToken(const std::string& token) override {
        ++validateCallCount_;

        ports::output::TokenValidationResult result;
        auto it = validTokens_.find(token);
        if (it != validTokens_.end()) {
            result.valid = true;
            result.customerId = it->second;
            result.message = "OK";
        } else {
            result.valid = false;
            result.message = "Invalid token";
        }
        return result;
    }

    std::optional<std::string> getCustomerIdFromToken(const std::string& token) override {
        auto result = validateAccessToken(token);
        if (result.valid) {
            return result.customerId;
        }
        return std::nullopt;
    }

private:
    std::map<std::string, std::string> validTokens_;  // token -> customerId
    int validateCallCount_ = 0;
};

} // namespace payment::tests
