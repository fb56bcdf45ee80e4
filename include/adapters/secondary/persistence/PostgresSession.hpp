// include/adapters/secondary/persistence/PostgresSession.hpp
#pragma once

#include "ports/output/IUnitOfWork.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <mutex>
#include <iostream>
#include <stdexcept>

namespace payment::adapters::secondary {

/**
 * @brief Общее соединение с PostgreSQL и открытая единица работы
 *
 * Все Postgres-репозитории выполняют SQL через exec(): внутри begin()/commit()
 * запрос идёт в текущую pqxx::work, вне её - в короткую транзакцию.
 * Соединение не потокобезопасно, поэтому доступ сериализован recursive_mutex;
 * поток, открывший единицу работы, держит его до commit()/rollback().
 */
class PostgresSession : public ports::output::IUnitOfWork {
public:
    explicit PostgresSession(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        // Схема создаётся в db/schema.sql, не здесь
        connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
        std::cout << "[PostgresSession] Connected to " << settings_->getName() << "@" << settings_->getHost() << " (sslmode=" << settings_->getSslMode() << ")" << std::endl;
    }

    void begin() override {
        mutex_.lock();
        try {
            ensureConnected();
            work_ = std::make_unique<pqxx::work>(*connection_);
        } catch (const std::exception& e) {
            std::cerr << "[PostgresSession] begin error: " << e.what() << std::endl;
            mutex_.unlock();
            throw;
        }
    }

    void commit() override {
        if (!work_) {
            throw std::logic_error("PostgresSession: commit() without begin()");
        }
        work_->commit();
        work_.reset();
        mutex_.unlock();
    }

    void rollback() override {
        if (!work_) {
            throw std::logic_error("PostgresSession: rollback() without begin()");
        }
        try {
            work_->abort();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresSession] abort error: " << e.what() << std::endl;
        }
        work_.reset();
        mutex_.unlock();
    }

    template <typename... Args>
    pqxx::result exec(const std::string& sql, Args&&... args) {
        std::lock_guard<std::recursive_mutex> lock(mutex_);

        if (work_) {
            return work_->exec_params(sql, std::forward<Args>(args)...);
        }

        ensureConnected();
        pqxx::work txn(*connection_);
        auto result = txn.exec_params(sql, std::forward<Args>(args)...);
        txn.commit();
        return result;
    }

private:
    void ensureConnected() {
        if (!connection_ || !connection_->is_open()) {
            std::cout << "[PostgresSession] Reconnecting..." << std::endl;
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
        }
    }

    std::shared_ptr<settings::DbSettings> settings_;
    std::unique_ptr<pqxx::connection> connection_;
    std::unique_ptr<pqxx::work> work_;
    std::recursive_mutex mutex_;
};

} // namespace payment::adapters::secondary
