#pragma once

#include "ports/output/IEventPublisher.hpp"
#include "settings/RabbitMQSettings.hpp"
#include <amqpcpp.h>
#include <amqpcpp/libboostasio.h>
#include <boost/asio.hpp>
#include <memory>
#include <thread>
#include <atomic>
#include <iostream>
#include <stdexcept>

namespace payment::adapters::secondary {

/**
 * @brief RabbitMQ адаптер для публикации событий оплаты
 *
 * - Exchange: topic (payment.events)
 * - Routing keys: invoice.issued, payment.completed, payment.failed
 *
 * Соединение обслуживается отдельным I/O потоком (boost::asio).
 * publish() выполняется в этом потоке через boost::asio::post.
 */
class RabbitMQAdapter : public ports::output::IEventPublisher {
public:
    explicit RabbitMQAdapter(std::shared_ptr<settings::RabbitMQSettings> settings)
        : settings_(std::move(settings))
        , running_(false)
        , ioContext_()
        , work_(boost::asio::make_work_guard(ioContext_))
        , handler_(ioContext_)
    {
        exchangeName_ = settings_->getExchange();
        std::cout << "[RabbitMQAdapter] Created for " << settings_->describe() << std::endl;
    }

    ~RabbitMQAdapter() override {
        stop();
    }

    /**
     * @brief Опубликовать событие
     * @param routingKey Ключ маршрутизации
     * @param message JSON-сообщение
     * @throws std::runtime_error если адаптер не запущен
     */
    void publish(const std::string& routingKey, const std::string& message) override {
        if (!running_) {
            throw std::runtime_error("RabbitMQ publisher is not running");
        }

        boost::asio::post(ioContext_, [this, routingKey, message]() {
            if (!channel_ || !ready_) {
                std::cerr << "[RabbitMQAdapter] Cannot publish " << routingKey
                          << ": not connected" << std::endl;
                return;
            }
            channel_->publish(exchangeName_, routingKey, message);
            std::cout << "[RabbitMQAdapter] Published " << routingKey
                      << ": " << message.substr(0, 100) << "..." << std::endl;
        });
    }

    void start() {
        if (running_) return;

        running_ = true;

        workerThread_ = std::thread([this]() {
            try {
                connect();
                ioContext_.run();
            } catch (const std::exception& e) {
                std::cerr << "[RabbitMQAdapter] Worker error: " << e.what() << std::endl;
            }
        });

        std::cout << "[RabbitMQAdapter] Started" << std::endl;
    }

    void stop() {
        if (!running_) return;

        running_ = false;
        work_.reset();
        ioContext_.stop();

        if (workerThread_.joinable()) {
            workerThread_.join();
        }

        channel_.reset();
        connection_.reset();

        std::cout << "[RabbitMQAdapter] Stopped" << std::endl;
    }

private:
    void connect() {
        connection_ = std::make_unique<AMQP::TcpConnection>(&handler_,
            AMQP::Address(settings_->getAmqpUrl()));
        channel_ = std::make_unique<AMQP::TcpChannel>(connection_.get());

        channel_->declareExchange(exchangeName_, AMQP::topic, AMQP::durable)
            .onSuccess([this]() {
                ready_ = true;
                std::cout << "[RabbitMQAdapter] Exchange declared: " << exchangeName_ << std::endl;
            })
            .onError([](const char* msg) {
                std::cerr << "[RabbitMQAdapter] Exchange error: " << msg << std::endl;
            });
    }

    std::shared_ptr<settings::RabbitMQSettings> settings_;
    std::string exchangeName_;

    std::atomic<bool> running_;
    std::atomic<bool> ready_{false};
    boost::asio::io_context ioContext_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    AMQP::LibBoostAsioHandler handler_;

    std::unique_ptr<AMQP::TcpConnection> connection_;
    std::unique_ptr<AMQP::TcpChannel> channel_;

    std::thread workerThread_;
};

} // namespace payment::adapters::secondary
