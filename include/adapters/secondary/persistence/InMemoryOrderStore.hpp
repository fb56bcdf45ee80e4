#pragma once

#include "ports/output/IOrderStore.hpp"
#include "adapters/secondary/persistence/IdGenerator.hpp"
#include "domain/Errors.hpp"
#include "domain/OrderStateMachine.hpp"
#include <map>
#include <mutex>
#include <algorithm>
#include <iostream>

namespace payment::adapters::secondary {

/**
 * @brief Хранилище заказов в памяти (PAYMENT_STORAGE=memory и тесты)
 *
 * snapshot()/restore() используются InMemoryUnitOfWork для отката.
 */
class InMemoryOrderStore : public ports::output::IOrderStore {
public:
    struct State {
        std::map<std::string, domain::Order> orders;
        std::map<std::string, uint64_t> sequence;   // порядок создания
        uint64_t nextSequence = 0;
    };

    std::optional<domain::Order> getOpenOrderForCustomer(const std::string& customerId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto* order = findOpenLocked(customerId);
        if (!order) {
            return std::nullopt;
        }
        return *order;
    }

    std::optional<domain::Order> findById(const std::string& orderId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = state_.orders.find(orderId);
        if (it == state_.orders.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<domain::Order> findByCustomer(const std::string& customerId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::Order> result;
        for (const auto& [id, order] : state_.orders) {
            if (order.customerId == customerId) {
                result.push_back(order);
            }
        }

        // Новые первыми
        std::sort(result.begin(), result.end(),
            [this](const domain::Order& a, const domain::Order& b) {
                return state_.sequence.at(a.id) > state_.sequence.at(b.id);
            });
        return result;
    }

    std::vector<domain::OrderLine> getOrderLines(const std::string& orderId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = state_.orders.find(orderId);
        if (it == state_.orders.end()) {
            return {};
        }
        return it->second.lines;
    }

    domain::Money computeOrderTotal(const std::string& orderId) override {
        return domain::Order::computeTotal(getOrderLines(orderId));
    }

    domain::Order getOrCreateOpenOrder(const std::string& customerId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto* existing = findOpenLocked(customerId)) {
            return *existing;
        }

        domain::Order order(ids_.next("ord"), customerId);
        state_.orders[order.id] = order;
        state_.sequence[order.id] = state_.nextSequence++;

        std::cout << "[InMemoryOrderStore] Created cart " << order.id
                  << " for " << customerId << std::endl;
        return order;
    }

    domain::OrderLine upsertLine(const domain::OrderLine& line) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& order = requireOpenLocked(line.orderId);

        auto now = domain::Timestamp::now();
        auto it = findLine(order, line.productKey);
        if (it != order.lines.end()) {
            it->quantity = line.quantity;
            it->updatedAt = now;
            order.updatedAt = now;
            return *it;
        }

        domain::OrderLine saved = line;
        if (saved.id.empty()) {
            saved.id = ids_.next("line");
        }
        saved.createdAt = now;
        saved.updatedAt = now;
        order.lines.push_back(saved);
        order.updatedAt = now;
        return saved;
    }

    bool setLineQuantity(const std::string& orderId, const std::string& productKey,
                         int64_t quantity) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& order = requireOpenLocked(orderId);

        auto it = findLine(order, productKey);
        if (it == order.lines.end()) {
            return false;
        }

        if (quantity <= 0) {
            order.lines.erase(it);
        } else {
            it->quantity = quantity;
            it->updatedAt = domain::Timestamp::now();
        }
        order.updatedAt = domain::Timestamp::now();
        return true;
    }

    bool removeLine(const std::string& orderId, const std::string& productKey) override {
        return setLineQuantity(orderId, productKey, 0);
    }

    bool deleteOrder(const std::string& orderId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = state_.orders.find(orderId);
        if (it == state_.orders.end() || it->second.status != domain::OrderStatus::OPEN) {
            return false;
        }
        state_.orders.erase(it);
        state_.sequence.erase(orderId);
        return true;
    }

    void setOrderStatus(const std::string& orderId, domain::OrderStatus status) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = state_.orders.find(orderId);
        if (it == state_.orders.end()) {
            throw domain::NotFoundError("Order not found: " + orderId);
        }
        domain::OrderStateMachine::requireTransition(it->second.status, status);
        it->second.updateStatus(status);
    }

    bool compareAndSetStatus(const std::string& orderId,
                             domain::OrderStatus expected,
                             domain::OrderStatus next) override {
        domain::OrderStateMachine::requireTransition(expected, next);
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = state_.orders.find(orderId);
        if (it == state_.orders.end() || it->second.status != expected) {
            return false;
        }
        it->second.updateStatus(next);
        return true;
    }

    State snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    void restore(State state) {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = std::move(state);
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_.orders.size();
    }

private:
    mutable std::mutex mutex_;
    State state_;
    IdGenerator ids_;

    domain::Order* findOpenLocked(const std::string& customerId) {
        for (auto& [id, order] : state_.orders) {
            if (order.customerId == customerId && order.status == domain::OrderStatus::OPEN) {
                return &order;
            }
        }
        return nullptr;
    }

    domain::Order& requireOpenLocked(const std::string& orderId) {
        auto it = state_.orders.find(orderId);
        if (it == state_.orders.end()) {
            throw domain::NotFoundError("Order not found: " + orderId);
        }
        if (it->second.status != domain::OrderStatus::OPEN) {
            throw domain::ConflictError("Order " + orderId + " is not open");
        }
        return it->second;
    }

    static std::vector<domain::OrderLine>::iterator findLine(domain::Order& order,
                                                             const std::string& productKey) {
        return std::find_if(order.lines.begin(), order.lines.end(),
            [&](const domain::OrderLine& l) { return l.productKey == productKey; });
    }
};

} // namespace payment::adapters::secondary
