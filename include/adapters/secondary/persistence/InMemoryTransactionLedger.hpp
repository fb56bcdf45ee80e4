#pragma once

#include "ports/output/ITransactionLedger.hpp"
#include "adapters/secondary/persistence/IdGenerator.hpp"
#include <map>
#include <mutex>
#include <algorithm>
#include <iostream>

namespace payment::adapters::secondary {

/**
 * @brief Журнал транзакций в памяти
 */
class InMemoryTransactionLedger : public ports::output::ITransactionLedger {
public:
    struct State {
        std::map<std::string, domain::PaymentTransaction> transactions;
        std::map<std::string, uint64_t> sequence;
        uint64_t nextSequence = 0;
    };

    std::string createTransaction(const std::string& orderId,
                                  const std::string& customerId,
                                  const std::string& paymentMethod,
                                  const domain::Money& amount,
                                  domain::PaymentStatus status) override {
        std::lock_guard<std::mutex> lock(mutex_);

        domain::PaymentTransaction tx;
        tx.id = ids_.next("txn");
        tx.orderId = orderId;
        tx.customerId = customerId;
        tx.paymentMethod = paymentMethod;
        tx.amount = amount;
        tx.status = status;
        tx.processedAt = domain::Timestamp::now();

        state_.transactions[tx.id] = tx;
        state_.sequence[tx.id] = state_.nextSequence++;

        std::cout << "[InMemoryTransactionLedger] Created " << tx.id << " for order " << orderId
                  << " (" << domain::toString(status) << ")" << std::endl;
        return tx.id;
    }

    bool updateTransactionStatus(const std::string& transactionId,
                                 domain::PaymentStatus status,
                                 const std::optional<std::string>& externalTransactionId,
                                 const std::optional<std::string>& errorMessage) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = state_.transactions.find(transactionId);
        if (it == state_.transactions.end() || domain::isFinal(it->second.status)) {
            return false;
        }

        auto& tx = it->second;
        tx.status = status;
        tx.processedAt = domain::Timestamp::now();
        if (externalTransactionId) {
            tx.externalTransactionId = externalTransactionId;
        }
        if (errorMessage) {
            tx.errorMessage = errorMessage;
        }
        return true;
    }

    std::optional<domain::PaymentTransaction> findById(const std::string& transactionId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = state_.transactions.find(transactionId);
        if (it == state_.transactions.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<domain::PaymentTransaction> findByOrderId(const std::string& orderId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::PaymentTransaction> result;
        for (const auto& [id, tx] : state_.transactions) {
            if (tx.orderId == orderId) {
                result.push_back(tx);
            }
        }
        std::sort(result.begin(), result.end(),
            [this](const domain::PaymentTransaction& a, const domain::PaymentTransaction& b) {
                return state_.sequence.at(a.id) > state_.sequence.at(b.id);
            });
        return result;
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
        return state_.transactions.size();
    }

private:
    mutable std::mutex mutex_;
    State state_;
    IdGenerator ids_;
};

} // namespace payment::adapters::secondary
