#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>

namespace payment::settings {

/**
 * @brief Настройки подключения к Auth Service
 *
 * Auth Service отвечает за две вещи: проверку Bearer токена
 * и справочник покупателей.
 *
 * Читает из ENV:
 * - AUTH_SERVICE_HOST (default: "auth-service")
 * - AUTH_SERVICE_PORT (default: 8080)
 * - AUTH_SERVICE_VALIDATE_PATH (default: "/api/v1/auth/validate")
 * - AUTH_SERVICE_USERS_PATH (default: "/api/v1/users")
 *
 * Некорректные значения → std::invalid_argument при старте.
 */
class AuthClientSettings {
public:
    AuthClientSettings() {
        if (const char* host = std::getenv("AUTH_SERVICE_HOST")) {
            host_ = host;
        }
        if (const char* port = std::getenv("AUTH_SERVICE_PORT")) {
            port_ = std::stoi(port);
        }
        if (const char* path = std::getenv("AUTH_SERVICE_VALIDATE_PATH")) {
            validatePath_ = path;
        }
        if (const char* path = std::getenv("AUTH_SERVICE_USERS_PATH")) {
            usersPath_ = path;
        }
        validate();
    }

    AuthClientSettings(const std::string& host, int port,
                       const std::string& validatePath, const std::string& usersPath)
        : host_(host)
        , port_(port)
        , validatePath_(validatePath)
        , usersPath_(usersPath)
    {
        validate();
    }

    std::string getHost() const { return host_; }
    int getPort() const { return port_; }
    std::string getValidatePath() const { return validatePath_; }

    /**
     * @brief Путь карточки покупателя: usersPath + "/" + id
     */
    std::string getUserPath(const std::string& customerId) const {
        return usersPath_ + "/" + customerId;
    }

private:
    std::string host_ = "auth-service";
    int port_ = 8080;
    std::string validatePath_ = "/api/v1/auth/validate";
    std::string usersPath_ = "/api/v1/users";

    void validate() {
        if (host_.empty()) {
            throw std::invalid_argument("AUTH_SERVICE_HOST must not be empty");
        }
        if (port_ < 1 || port_ > 65535) {
            throw std::invalid_argument("AUTH_SERVICE_PORT must be between 1 and 65535");
        }
        if (validatePath_.empty() || validatePath_.front() != '/') {
            throw std::invalid_argument("AUTH_SERVICE_VALIDATE_PATH must start with '/'");
        }
        if (usersPath_.empty() || usersPath_.front() != '/') {
            throw std::invalid_argument("AUTH_SERVICE_USERS_PATH must start with '/'");
        }
        // "/api/v1/users/" и "/api/v1/users" дают один и тот же путь карточки
        while (usersPath_.size() > 1 && usersPath_.back() == '/') {
            usersPath_.pop_back();
        }
    }
};

} // namespace payment::settings
