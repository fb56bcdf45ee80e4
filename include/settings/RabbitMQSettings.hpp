#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>

namespace payment::settings {

/**
 * @brief Настройки RabbitMQ
 *
 * Читает из ENV:
 * - RABBITMQ_HOST (default: "rabbitmq")
 * - RABBITMQ_PORT (default: 5672)
 * - RABBITMQ_USER (default: "guest")
 * - RABBITMQ_PASSWORD (default: "guest")
 * - RABBITMQ_VHOST (default: "/")
 * - RABBITMQ_EXCHANGE (default: "payment.events"), topic exchange
 *   для invoice.issued, payment.completed, payment.failed
 *
 * Некорректные значения → std::invalid_argument при старте.
 */
class RabbitMQSettings {
public:
    RabbitMQSettings() {
        if (const char* host = std::getenv("RABBITMQ_HOST")) {
            host_ = host;
        }
        if (const char* port = std::getenv("RABBITMQ_PORT")) {
            port_ = std::stoi(port);
        }
        if (const char* user = std::getenv("RABBITMQ_USER")) {
            user_ = user;
        }
        if (const char* password = std::getenv("RABBITMQ_PASSWORD")) {
            password_ = password;
        }
        if (const char* vhost = std::getenv("RABBITMQ_VHOST")) {
            vhost_ = vhost;
        }
        if (const char* exchange = std::getenv("RABBITMQ_EXCHANGE")) {
            exchange_ = exchange;
        }
        validate();
    }

    RabbitMQSettings(const std::string& host, int port,
                     const std::string& user, const std::string& password,
                     const std::string& vhost, const std::string& exchange)
        : host_(host)
        , port_(port)
        , user_(user)
        , password_(password)
        , vhost_(vhost)
        , exchange_(exchange)
    {
        validate();
    }

    std::string getHost() const { return host_; }
    int getPort() const { return port_; }
    std::string getUser() const { return user_; }
    std::string getPassword() const { return password_; }
    std::string getVhost() const { return vhost_; }
    std::string getExchange() const { return exchange_; }

    /**
     * @brief Адрес брокера для AMQP::Address
     *
     * AMQP::Address берёт vhost из пути как есть, пустой путь означает "/".
     */
    std::string getAmqpUrl() const {
        std::string path = vhost_.front() == '/' ? vhost_.substr(1) : vhost_;
        return "amqp://" + user_ + ":" + password_ + "@" +
               host_ + ":" + std::to_string(port_) + "/" + path;
    }

    /**
     * @brief Адрес для логов, без пароля
     */
    std::string describe() const {
        return host_ + ":" + std::to_string(port_) + " vhost=" + vhost_ +
               " exchange=" + exchange_;
    }

private:
    std::string host_ = "rabbitmq";
    int port_ = 5672;
    std::string user_ = "guest";
    std::string password_ = "guest";
    std::string vhost_ = "/";
    std::string exchange_ = "payment.events";

    void validate() const {
        if (host_.empty()) {
            throw std::invalid_argument("RABBITMQ_HOST must not be empty");
        }
        if (port_ < 1 || port_ > 65535) {
            throw std::invalid_argument("RABBITMQ_PORT must be between 1 and 65535");
        }
        if (vhost_.empty()) {
            throw std::invalid_argument("RABBITMQ_VHOST must not be empty");
        }
        // Пустое имя в AMQP означает default exchange, где topic маршрутизация не работает
        if (exchange_.empty()) {
            throw std::invalid_argument("RABBITMQ_EXCHANGE must not be empty");
        }
    }
};

} // namespace payment::settings
