#pragma once

#include <stdexcept>
#include <string>

namespace payment::domain {

/**
 * @brief Базовое исключение сервиса оплаты
 *
 * HTTP-слой переводит подклассы в коды ответа:
 * ValidationError → 400, ForbiddenError → 403, NotFoundError → 404,
 * ConflictError / InvalidTransitionError → 409, GatewayTransportError → 502.
 */
class PaymentServiceError : public std::runtime_error {
public:
    explicit PaymentServiceError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Некорректный запрос (метод, карта, пустая корзина)
 */
class ValidationError : public PaymentServiceError {
public:
    explicit ValidationError(const std::string& message)
        : PaymentServiceError(message) {}
};

class NotFoundError : public PaymentServiceError {
public:
    explicit NotFoundError(const std::string& message)
        : PaymentServiceError(message) {}
};

/**
 * @brief Заказ принадлежит другому покупателю
 */
class ForbiddenError : public PaymentServiceError {
public:
    explicit ForbiddenError(const std::string& message)
        : PaymentServiceError(message) {}
};

/**
 * @brief Параллельная попытка оплаты уже забрала корзину
 */
class ConflictError : public PaymentServiceError {
public:
    explicit ConflictError(const std::string& message)
        : PaymentServiceError(message) {}
};

class InvalidTransitionError : public PaymentServiceError {
public:
    explicit InvalidTransitionError(const std::string& message)
        : PaymentServiceError(message) {}
};

/**
 * @brief Сбой транспорта до платёжного шлюза (исход платежа неизвестен)
 */
class GatewayTransportError : public PaymentServiceError {
public:
    explicit GatewayTransportError(const std::string& message)
        : PaymentServiceError(message) {}
};

} // namespace payment::domain
