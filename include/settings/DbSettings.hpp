// include/settings/DbSettings.hpp
#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>

namespace payment::settings
{

    /**
     * @brief Настройки подключения к PostgreSQL
     *
     * Читает параметры из переменных окружения (K8s ENV):
     * - PAYMENT_DB_HOST, PAYMENT_DB_PORT, PAYMENT_DB_NAME
     * - PAYMENT_DB_USER, PAYMENT_DB_PASSWORD
     * - PAYMENT_DB_CONNECT_TIMEOUT_SEC (default: 5, 0 = ждать без ограничения)
     * - PAYMENT_DB_SSLMODE (default: "prefer")
     *
     * Некорректные значения → std::invalid_argument при старте.
     */
    class DbSettings
    {
    public:
        DbSettings()
        {
            host_ = getEnvOrDefault("PAYMENT_DB_HOST", "payment-postgres");
            port_ = std::stoi(getEnvOrDefault("PAYMENT_DB_PORT", "5432"));
            name_ = getEnvOrDefault("PAYMENT_DB_NAME", "payment_db");
            user_ = getEnvOrDefault("PAYMENT_DB_USER", "payment_user");
            password_ = getEnvOrDefault("PAYMENT_DB_PASSWORD", "payment_secret_password");
            connectTimeoutSec_ = std::stoi(getEnvOrDefault("PAYMENT_DB_CONNECT_TIMEOUT_SEC", "5"));
            sslMode_ = getEnvOrDefault("PAYMENT_DB_SSLMODE", "prefer");
            validate();
        }

        DbSettings(const std::string &host, int port, const std::string &name,
                   const std::string &user, const std::string &password,
                   int connectTimeoutSec, const std::string &sslMode)
            : host_(host), port_(port), name_(name), user_(user), password_(password),
              connectTimeoutSec_(connectTimeoutSec), sslMode_(sslMode)
        {
            validate();
        }

        std::string getHost() const { return host_; }
        int getPort() const { return port_; }
        std::string getName() const { return name_; }
        std::string getUser() const { return user_; }
        int getConnectTimeoutSec() const { return connectTimeoutSec_; }
        std::string getSslMode() const { return sslMode_; }

        /**
         * @brief Строка подключения libpq (key='value')
         *
         * Значения в кавычках, поэтому пароль может содержать пробелы и кавычки.
         */
        std::string getConnectionString() const
        {
            return "host=" + quote(host_) +
                   " port=" + std::to_string(port_) +
                   " dbname=" + quote(name_) +
                   " user=" + quote(user_) +
                   " password=" + quote(password_) +
                   " connect_timeout=" + std::to_string(connectTimeoutSec_) +
                   " sslmode=" + quote(sslMode_) +
                   " application_name='payment-service'";
        }

    private:
        std::string host_;
        int port_;
        std::string name_;
        std::string user_;
        std::string password_;
        int connectTimeoutSec_;
        std::string sslMode_;

        void validate() const
        {
            if (host_.empty() || name_.empty() || user_.empty())
            {
                throw std::invalid_argument("PAYMENT_DB_HOST, PAYMENT_DB_NAME and PAYMENT_DB_USER must not be empty");
            }
            if (port_ < 1 || port_ > 65535)
            {
                throw std::invalid_argument("PAYMENT_DB_PORT must be between 1 and 65535");
            }
            if (connectTimeoutSec_ < 0)
            {
                throw std::invalid_argument("PAYMENT_DB_CONNECT_TIMEOUT_SEC must be >= 0");
            }
            if (sslMode_ != "disable" && sslMode_ != "allow" && sslMode_ != "prefer" &&
                sslMode_ != "require" && sslMode_ != "verify-ca" && sslMode_ != "verify-full")
            {
                throw std::invalid_argument("PAYMENT_DB_SSLMODE is not a libpq sslmode: " + sslMode_);
            }
        }

        static std::string quote(const std::string &value)
        {
            std::string quoted = "'";
            for (char c : value)
            {
                if (c == '\'' || c == '\\')
                {
                    quoted += '\\';
                }
                quoted += c;
            }
            quoted += '\'';
            return quoted;
        }

        static std::string getEnvOrDefault(const char *name, const char *defaultValue)
        {
            const char *value = std::getenv(name);
            return value ? std::string(value) : std::string(defaultValue);
        }
    };

} // namespace payment::settings
