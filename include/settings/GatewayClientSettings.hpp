#pragma once

#include "settings/IGatewayClientSettings.hpp"
#include <cstdlib>
#include <string>

namespace payment::settings {

class GatewayClientSettings : public IGatewayClientSettings {
public:
    std::string getHost() const override {
        const char* host = std::getenv("PAYMENT_GATEWAY_HOST");
        return host ? host : "payment-gateway";
    }

    int getPort() const override {
        const char* port = std::getenv("PAYMENT_GATEWAY_PORT");
        return port ? std::stoi(port) : 5000;
    }

    std::string getCardPath() const override {
        const char* path = std::getenv("PAYMENT_GATEWAY_CARD_PATH");
        return path ? path : "/api/payments/card";
    }

    std::string getTerminalPath() const override {
        const char* path = std::getenv("PAYMENT_GATEWAY_TERMINAL_PATH");
        return path ? path : "/api/payments/terminal";
    }
};

} // namespace payment::settings
