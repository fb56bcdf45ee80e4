#pragma once

#include "domain/Timestamp.hpp"
#include <string>
#include <memory>

namespace payment::domain {

/**
 * @brief Базовый класс для доменных событий сервиса оплаты
 *
 * eventType совпадает с routing key в RabbitMQ.
 */
struct DomainEvent {
    std::string eventId;        ///< id события
    std::string eventType;      ///< Тип события (payment.completed, invoice.issued)
    Timestamp timestamp;        ///< Время создания события

    DomainEvent() : timestamp(Timestamp::now()) {}

    explicit DomainEvent(const std::string& type)
        : eventType(type), timestamp(Timestamp::now()) {}

    virtual ~DomainEvent() = default;

    /**
     * @brief Сериализовать в JSON
     */
    virtual std::string toJson() const = 0;

    virtual std::unique_ptr<DomainEvent> clone() const = 0;
};

} // namespace payment::domain
