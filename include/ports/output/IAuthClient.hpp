#pragma once

#include <string>
#include <optional>

namespace payment::ports::output {

/**
 * @brief Результат валидации токена
 */
struct TokenValidationResult {
    bool valid = false;
    std::string message;
    std::string customerId;
};

/**
 * @brief Интерфейс клиента к Auth Service
 */
class IAuthClient {
public:
    virtual ~IAuthClient() = default;

    virtual TokenValidationResult validateAccessToken(const std::string& token) = 0;

    /**
     * @brief Извлечь id покупателя из токена
     * @return nullopt если токен невалидный
     */
    virtual std::optional<std::string> getCustomerIdFromToken(const std::string& token) = 0;
};

} // namespace payment::ports::output
