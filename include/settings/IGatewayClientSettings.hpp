#pragma once

#include <string>

namespace payment::settings {

class IGatewayClientSettings {
public:
    virtual ~IGatewayClientSettings() = default;

    virtual std::string getHost() const = 0;
    virtual int getPort() const = 0;
    virtual std::string getCardPath() const = 0;
    virtual std::string getTerminalPath() const = 0;
};

} // namespace payment::settings
