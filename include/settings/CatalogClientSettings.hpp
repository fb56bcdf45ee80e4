#pragma once

#include <string>
#include <cstdlib>

namespace payment::settings {

/**
 * @brief Настройки подключения к Catalog Service
 *
 * Читает из ENV:
 * - CATALOG_SERVICE_HOST (default: "catalog-service")
 * - CATALOG_SERVICE_PORT (default: 8082)
 */
class CatalogClientSettings {
public:
    CatalogClientSettings() {
        if (const char* host = std::getenv("CATALOG_SERVICE_HOST")) {
            host_ = host;
        }
        if (const char* port = std::getenv("CATALOG_SERVICE_PORT")) {
            port_ = std::stoi(port);
        }
    }

    std::string getHost() const { return host_; }
    int getPort() const { return port_; }

private:
    std::string host_ = "catalog-service";
    int port_ = 8082;
};

} // namespace payment::settings
