// include/adapters/secondary/persistence/PostgresTransactionLedger.hpp
#pragma once

#include "ports/output/ITransactionLedger.hpp"
#include "adapters/secondary/persistence/PostgresSession.hpp"
#include "adapters/secondary/persistence/IdGenerator.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace payment::adapters::secondary {

/**
 * @brief PostgreSQL журнал транзакций (таблица payment_transactions)
 */
class PostgresTransactionLedger : public ports::output::ITransactionLedger {
public:
    explicit PostgresTransactionLedger(std::shared_ptr<PostgresSession> session)
        : session_(std::move(session))
    {
        std::cout << "[PostgresTransactionLedger] Initialized" << std::endl;
    }

    std::string createTransaction(const std::string& orderId,
                                  const std::string& customerId,
                                  const std::string& paymentMethod,
                                  const domain::Money& amount,
                                  domain::PaymentStatus status) override {
        std::string id = ids_.next("txn");
        auto now = domain::Timestamp::now().toDisplayString();

        session_->exec(
            "INSERT INTO payment_transactions "
            "(id, order_id, customer_id, payment_method, amount_units, amount_nano, currency, "
            " status, created_at, processed_at) "
            "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9::timestamp, $9::timestamp)",
            id, orderId, customerId, paymentMethod,
            amount.units, amount.nano, amount.currency,
            domain::toString(status), now
        );

        std::cout << "[PostgresTransactionLedger] Created " << id << " for order " << orderId
                  << " (" << domain::toString(status) << ")" << std::endl;
        return id;
    }

    bool updateTransactionStatus(const std::string& transactionId,
                                 domain::PaymentStatus status,
                                 const std::optional<std::string>& externalTransactionId,
                                 const std::optional<std::string>& errorMessage) override {
        auto result = session_->exec(
            "UPDATE payment_transactions SET "
            "status = $2, "
            "external_transaction_id = COALESCE($3, external_transaction_id), "
            "error_message = COALESCE($4, error_message), "
            "processed_at = $5::timestamp "
            "WHERE id = $1 AND status NOT IN ('COMPLETED', 'FAILED')",
            transactionId,
            domain::toString(status),
            externalTransactionId,
            errorMessage,
            domain::Timestamp::now().toDisplayString()
        );
        return result.affected_rows() == 1;
    }

    std::optional<domain::PaymentTransaction> findById(const std::string& transactionId) override {
        auto result = session_->exec(TX_SELECT + "WHERE id = $1", transactionId);
        if (result.empty()) {
            return std::nullopt;
        }
        return rowToTransaction(result[0]);
    }

    std::vector<domain::PaymentTransaction> findByOrderId(const std::string& orderId) override {
        auto result = session_->exec(
            TX_SELECT + "WHERE order_id = $1 "
            "ORDER BY payment_transactions.created_at DESC, payment_transactions.id DESC",
            orderId
        );

        std::vector<domain::PaymentTransaction> transactions;
        for (const auto& row : result) {
            transactions.push_back(rowToTransaction(row));
        }
        return transactions;
    }

private:
    static inline const std::string TX_SELECT =
        "SELECT id, order_id, customer_id, payment_method, amount_units, amount_nano, currency, "
        "       status, to_char(processed_at, 'YYYY-MM-DD HH24:MI:SS') AS processed_at, "
        "       external_transaction_id, error_message "
        "FROM payment_transactions ";

    std::shared_ptr<PostgresSession> session_;
    IdGenerator ids_;

    static domain::PaymentTransaction rowToTransaction(const pqxx::row& row) {
        domain::PaymentTransaction tx;
        tx.id = row["id"].as<std::string>();
        tx.orderId = row["order_id"].as<std::string>();
        tx.customerId = row["customer_id"].as<std::string>();
        tx.paymentMethod = row["payment_method"].as<std::string>();
        tx.amount = domain::Money(
            row["amount_units"].as<int64_t>(),
            row["amount_nano"].as<int32_t>(),
            row["currency"].as<std::string>()
        );
        tx.status = domain::parsePaymentStatus(row["status"].as<std::string>());
        tx.processedAt = domain::Timestamp::fromString(row["processed_at"].as<std::string>());
        if (!row["external_transaction_id"].is_null()) {
            tx.externalTransactionId = row["external_transaction_id"].as<std::string>();
        }
        if (!row["error_message"].is_null()) {
            tx.errorMessage = row["error_message"].as<std::string>();
        }
        return tx;
    }
};

} // namespace payment::adapters::secondary
