#pragma once

#include "ports/output/IEventPublisher.hpp"
#include <vector>
#include <string>
#include <stdexcept>

namespace payment::tests {

/**
 * @brief Mock реализация IEventPublisher для тестов
 */
class MockEventPublisher : public ports::output::IEventPublisher {
public:
    struct PublishedMessage {
        std::string routingKey;
        std::string message;
    };

    const std::vector<PublishedMessage>& getPublishedMessages() const {
        return messages_;
    }

    void clearMessages() {
        messages_.clear();
    }

    int publishCallCount() const { return static_cast<int>(messages_.size()); }

    // Брокер недоступен: publish() бросает исключение
    void setFailing(bool failing) { failing_ = failing; }

    void publish(const std::string& routingKey, const std::string& message) override {
        if (failing_) {
            throw std::runtime_error("RabbitMQ not connected");
        }
        messages_.push_back({routingKey, message});
    }

private:
    std::vector<PublishedMessage> messages_;
    bool failing_ = false;
};

} // namespace payment::tests
