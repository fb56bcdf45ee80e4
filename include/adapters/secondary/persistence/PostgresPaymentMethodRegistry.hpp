#pragma once

#include "ports/output/IPaymentMethodRegistry.hpp"
#include "adapters/secondary/persistence/PostgresSession.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace payment::adapters::secondary {

/**
 * @brief Справочник методов оплаты из таблицы payment_methods
 */
class PostgresPaymentMethodRegistry : public ports::output::IPaymentMethodRegistry {
public:
    explicit PostgresPaymentMethodRegistry(std::shared_ptr<PostgresSession> session)
        : session_(std::move(session))
    {
        std::cout << "[PostgresPaymentMethodRegistry] Initialized" << std::endl;
    }

    bool isMethodActive(const std::string& code) override {
        auto result = session_->exec(
            "SELECT 1 FROM payment_methods WHERE lower(code) = lower($1) AND is_active",
            code
        );
        return !result.empty();
    }

    std::vector<domain::PaymentMethod> listActiveMethods() override {
        auto result = session_->exec(
            "SELECT code, title, description, image_url, is_active, display_order "
            "FROM payment_methods WHERE is_active ORDER BY display_order"
        );

        std::vector<domain::PaymentMethod> methods;
        for (const auto& row : result) {
            methods.emplace_back(
                row["code"].as<std::string>(),
                row["title"].as<std::string>(),
                row["description"].is_null() ? "" : row["description"].as<std::string>(),
                row["image_url"].is_null() ? "" : row["image_url"].as<std::string>(),
                row["is_active"].as<bool>(),
                row["display_order"].as<int>()
            );
        }
        return methods;
    }

private:
    std::shared_ptr<PostgresSession> session_;
};

} // namespace payment::adapters::secondary
