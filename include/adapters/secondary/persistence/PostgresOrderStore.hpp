// include/adapters/secondary/persistence/PostgresOrderStore.hpp
#pragma once

#include "ports/output/IOrderStore.hpp"
#include "adapters/secondary/persistence/PostgresSession.hpp"
#include "adapters/secondary/persistence/IdGenerator.hpp"
#include "domain/Errors.hpp"
#include "domain/OrderStateMachine.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace payment::adapters::secondary {

/**
 * @brief PostgreSQL хранилище заказов (таблицы orders, order_lines)
 *
 * Деньги хранятся как units + nano, время как TIMESTAMP (UTC).
 * Инвариант "один OPEN заказ на покупателя" держит частичный
 * уникальный индекс uq_orders_open_per_customer.
 */
class PostgresOrderStore : public ports::output::IOrderStore {
public:
    explicit PostgresOrderStore(std::shared_ptr<PostgresSession> session)
        : session_(std::move(session))
    {
        std::cout << "[PostgresOrderStore] Initialized" << std::endl;
    }

    // ============================================
    // ЧТЕНИЕ
    // ============================================

    std::optional<domain::Order> getOpenOrderForCustomer(const std::string& customerId) override {
        auto result = session_->exec(
            ORDER_SELECT + "WHERE customer_id = $1 AND status = 'OPEN'",
            customerId
        );
        if (result.empty()) {
            return std::nullopt;
        }
        return withLines(rowToOrder(result[0]));
    }

    std::optional<domain::Order> findById(const std::string& orderId) override {
        auto result = session_->exec(ORDER_SELECT + "WHERE id = $1", orderId);
        if (result.empty()) {
            return std::nullopt;
        }
        return withLines(rowToOrder(result[0]));
    }

    std::vector<domain::Order> findByCustomer(const std::string& customerId) override {
        auto result = session_->exec(
            ORDER_SELECT + "WHERE customer_id = $1 ORDER BY orders.created_at DESC, orders.id DESC",
            customerId
        );

        std::vector<domain::Order> orders;
        for (const auto& row : result) {
            orders.push_back(withLines(rowToOrder(row)));
        }
        return orders;
    }

    std::vector<domain::OrderLine> getOrderLines(const std::string& orderId) override {
        auto result = session_->exec(
            "SELECT id, order_id, product_id, product_key, product_name, quantity, "
            "       price_units, price_nano, currency, discount_percent, "
            "       to_char(created_at, 'YYYY-MM-DD HH24:MI:SS') AS created_at, "
            "       to_char(updated_at, 'YYYY-MM-DD HH24:MI:SS') AS updated_at "
            "FROM order_lines WHERE order_id = $1 "
            "ORDER BY order_lines.created_at, order_lines.id",
            orderId
        );

        std::vector<domain::OrderLine> lines;
        for (const auto& row : result) {
            lines.push_back(rowToLine(row));
        }
        return lines;
    }

    domain::Money computeOrderTotal(const std::string& orderId) override {
        return domain::Order::computeTotal(getOrderLines(orderId));
    }

    // ============================================
    // ЗАПИСЬ
    // ============================================

    domain::Order getOrCreateOpenOrder(const std::string& customerId) override {
        auto existing = getOpenOrderForCustomer(customerId);
        if (existing) {
            return *existing;
        }

        domain::Order order(ids_.next("ord"), customerId);
        session_->exec(
            "INSERT INTO orders (id, customer_id, status, created_at, updated_at) "
            "VALUES ($1, $2, 'OPEN', $3::timestamp, $3::timestamp) "
            "ON CONFLICT (customer_id) WHERE status = 'OPEN' DO NOTHING",
            order.id,
            customerId,
            order.createdAt.toDisplayString()
        );

        auto created = getOpenOrderForCustomer(customerId);
        if (!created) {
            throw std::runtime_error("Failed to create cart for customer " + customerId);
        }
        std::cout << "[PostgresOrderStore] Created cart " << created->id
                  << " for " << customerId << std::endl;
        return *created;
    }

    domain::OrderLine upsertLine(const domain::OrderLine& line) override {
        requireOpen(line.orderId);

        domain::OrderLine saved = line;
        auto now = domain::Timestamp::now();
        auto result = session_->exec(
            "INSERT INTO order_lines "
            "(id, order_id, product_id, product_key, product_name, quantity, "
            " price_units, price_nano, currency, discount_percent, created_at, updated_at) "
            "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11::timestamp, $11::timestamp) "
            "ON CONFLICT (order_id, product_key) DO UPDATE SET "
            "quantity = EXCLUDED.quantity, "
            "updated_at = EXCLUDED.updated_at "
            "RETURNING id",
            line.id.empty() ? ids_.next("line") : line.id,
            line.orderId,
            line.productId,
            line.productKey,
            line.productName,
            line.quantity,
            line.unitPrice.units,
            line.unitPrice.nano,
            line.unitPrice.currency,
            line.discountPercent,
            now.toDisplayString()
        );

        saved.id = result[0]["id"].as<std::string>();
        saved.updatedAt = now;
        touchOrder(line.orderId, now);
        return saved;
    }

    bool setLineQuantity(const std::string& orderId, const std::string& productKey,
                         int64_t quantity) override {
        if (quantity <= 0) {
            return removeLine(orderId, productKey);
        }

        requireOpen(orderId);
        auto now = domain::Timestamp::now();
        auto result = session_->exec(
            "UPDATE order_lines SET quantity = $3, updated_at = $4::timestamp "
            "WHERE order_id = $1 AND product_key = $2",
            orderId, productKey, quantity, now.toDisplayString()
        );
        if (result.affected_rows() == 0) {
            return false;
        }
        touchOrder(orderId, now);
        return true;
    }

    bool removeLine(const std::string& orderId, const std::string& productKey) override {
        requireOpen(orderId);
        auto result = session_->exec(
            "DELETE FROM order_lines WHERE order_id = $1 AND product_key = $2",
            orderId, productKey
        );
        if (result.affected_rows() == 0) {
            return false;
        }
        touchOrder(orderId, domain::Timestamp::now());
        return true;
    }

    bool deleteOrder(const std::string& orderId) override {
        // order_lines удаляются каскадно; заказ вне OPEN не трогаем
        auto result = session_->exec(
            "DELETE FROM orders WHERE id = $1 AND status = 'OPEN'", orderId);
        return result.affected_rows() > 0;
    }

    void setOrderStatus(const std::string& orderId, domain::OrderStatus status) override {
        auto current = session_->exec("SELECT status FROM orders WHERE id = $1 FOR UPDATE", orderId);
        if (current.empty()) {
            throw domain::NotFoundError("Order not found: " + orderId);
        }
        auto from = domain::parseOrderStatus(current[0]["status"].as<std::string>());
        if (!compareAndSetStatus(orderId, from, status)) {
            throw domain::ConflictError("Order " + orderId + " status changed concurrently");
        }
    }

    bool compareAndSetStatus(const std::string& orderId,
                             domain::OrderStatus expected,
                             domain::OrderStatus next) override {
        domain::OrderStateMachine::requireTransition(expected, next);
        auto now = domain::Timestamp::now().toDisplayString();
        auto result = session_->exec(
            "UPDATE orders SET status = $3, updated_at = $4::timestamp, "
            "finalized_at = CASE WHEN $3 IN ('PAID', 'CANCELLED') THEN $4::timestamp "
            "                    ELSE finalized_at END "
            "WHERE id = $1 AND status = $2",
            orderId, domain::toString(expected), domain::toString(next), now
        );
        return result.affected_rows() == 1;
    }

private:
    static inline const std::string ORDER_SELECT =
        "SELECT id, customer_id, status, "
        "       to_char(created_at, 'YYYY-MM-DD HH24:MI:SS') AS created_at, "
        "       to_char(updated_at, 'YYYY-MM-DD HH24:MI:SS') AS updated_at, "
        "       to_char(finalized_at, 'YYYY-MM-DD HH24:MI:SS') AS finalized_at "
        "FROM orders ";

    std::shared_ptr<PostgresSession> session_;
    IdGenerator ids_;

    /**
     * @brief Блокирует строку заказа до конца единицы работы
     *
     * Изменение позиций и compareAndSetStatus() идут через одну блокировку,
     * поэтому позиции не меняются после перехода в CHECKOUT.
     */
    void requireOpen(const std::string& orderId) {
        auto result = session_->exec("SELECT status FROM orders WHERE id = $1 FOR UPDATE", orderId);
        if (result.empty()) {
            throw domain::NotFoundError("Order not found: " + orderId);
        }
        if (result[0]["status"].as<std::string>() != "OPEN") {
            throw domain::ConflictError("Order " + orderId + " is not open");
        }
    }

    void touchOrder(const std::string& orderId, const domain::Timestamp& now) {
        session_->exec(
            "UPDATE orders SET updated_at = $2::timestamp WHERE id = $1",
            orderId, now.toDisplayString()
        );
    }

    domain::Order withLines(domain::Order order) {
        order.lines = getOrderLines(order.id);
        return order;
    }

    static domain::Order rowToOrder(const pqxx::row& row) {
        domain::Order order;
        order.id = row["id"].as<std::string>();
        order.customerId = row["customer_id"].as<std::string>();
        order.status = domain::parseOrderStatus(row["status"].as<std::string>());
        order.createdAt = domain::Timestamp::fromString(row["created_at"].as<std::string>());
        order.updatedAt = domain::Timestamp::fromString(row["updated_at"].as<std::string>());
        if (!row["finalized_at"].is_null()) {
            order.finalizedAt = domain::Timestamp::fromString(row["finalized_at"].as<std::string>());
        }
        return order;
    }

    static domain::OrderLine rowToLine(const pqxx::row& row) {
        domain::OrderLine line;
        line.id = row["id"].as<std::string>();
        line.orderId = row["order_id"].as<std::string>();
        line.productId = row["product_id"].as<std::string>();
        line.productKey = row["product_key"].as<std::string>();
        line.productName = row["product_name"].as<std::string>();
        line.quantity = row["quantity"].as<int64_t>();
        line.unitPrice = domain::Money(
            row["price_units"].as<int64_t>(),
            row["price_nano"].as<int32_t>(),
            row["currency"].as<std::string>()
        );
        line.discountPercent = row["discount_percent"].as<int>();
        line.createdAt = domain::Timestamp::fromString(row["created_at"].as<std::string>());
        line.updatedAt = domain::Timestamp::fromString(row["updated_at"].as<std::string>());
        return line;
    }
};

} // namespace payment::adapters::secondary
