#pragma once

#include "ports/input/IPaymentService.hpp"
#include "ports/output/ICustomerDirectory.hpp"
#include "ports/output/IPaymentMethodRegistry.hpp"
#include "ports/output/IOrderStore.hpp"
#include "ports/output/ITransactionLedger.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include "ports/output/IPaymentGateway.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "application/InvoiceGenerator.hpp"
#include "application/UnitOfWorkScope.hpp"
#include "domain/Errors.hpp"
#include "domain/OrderStateMachine.hpp"
#include "domain/GatewayRequest.hpp"
#include "domain/events/InvoiceIssuedEvent.hpp"
#include "domain/events/PaymentCompletedEvent.hpp"
#include "domain/events/PaymentFailedEvent.hpp"
#include "settings/PaymentSettings.hpp"
#include <memory>
#include <iostream>
#include <random>
#include <sstream>
#include <iomanip>
#include <mutex>

namespace payment::application {

/**
 * @brief Оркестратор оплаты корзины
 *
 * Порядок processPayment():
 * 1. Проверки (покупатель, метод, карта, корзина) до любых изменений
 * 2. Единица работы #1: OPEN → CHECKOUT (compare-and-set), сумма по
 *    зафиксированным позициям, запись транзакции
 * 3. bank: генерация счёта; terminal / visa: вызов шлюза с повторами
 * 4. Единица работы #2: итоговый статус транзакции и заказа
 * 5. Публикация события в RabbitMQ
 *
 * Отказ шлюза не является исключением: заказ отменяется, success=false.
 * Сбой транспорта на последней попытке оставляет заказ в CHECKOUT, а
 * транзакцию в PROCESSING (с текстом ошибки) и пробрасывается дальше.
 */
class PaymentService : public ports::input::IPaymentService {
public:
    PaymentService(
        std::shared_ptr<ports::output::ICustomerDirectory> customers,
        std::shared_ptr<ports::output::IPaymentMethodRegistry> methods,
        std::shared_ptr<ports::output::IOrderStore> orderStore,
        std::shared_ptr<ports::output::ITransactionLedger> ledger,
        std::shared_ptr<ports::output::IUnitOfWork> unitOfWork,
        std::shared_ptr<ports::output::IPaymentGateway> gateway,
        std::shared_ptr<ports::output::IEventPublisher> eventPublisher,
        std::shared_ptr<settings::PaymentSettings> settings
    ) : customers_(std::move(customers))
      , methods_(std::move(methods))
      , orderStore_(std::move(orderStore))
      , ledger_(std::move(ledger))
      , unitOfWork_(std::move(unitOfWork))
      , gateway_(std::move(gateway))
      , eventPublisher_(std::move(eventPublisher))
      , settings_(std::move(settings))
      , rng_(std::random_device{}())
    {
        std::cout << "[PaymentService] Created" << std::endl;
    }

    domain::PaymentResult processPayment(
        const std::string& customerId,
        const domain::PaymentRequest& request) override
    {
        std::cout << "[PaymentService] processPayment: customer=" << customerId
                  << " method=" << request.method << std::endl;

        // ============================================
        // ПРОВЕРКИ (без изменений состояния)
        // ============================================

        if (!customers_->exists(customerId)) {
            throw domain::NotFoundError("Customer not found: " + customerId);
        }

        if (!methods_->isMethodActive(request.method)) {
            throw domain::ValidationError("Unsupported payment method: " + request.method);
        }

        auto kind = domain::methodKindFromCode(request.method);
        if (!kind) {
            throw domain::ValidationError("Unsupported payment method: " + request.method);
        }

        if (*kind == domain::PaymentMethodKind::CARD) {
            validateCard(request.card);
        }

        auto order = orderStore_->getOpenOrderForCustomer(customerId);
        if (!order) {
            throw domain::ValidationError("No active cart found");
        }
        if (order->lines.empty()) {
            throw domain::ValidationError("Cart is empty");
        }

        std::string methodCode = domain::normalizeMethodCode(request.method);

        auto checkout = beginCheckout(*order, customerId, methodCode, *kind);
        const std::string& transactionId = checkout.transactionId;
        const domain::Money& amount = checkout.amount;

        if (*kind == domain::PaymentMethodKind::BANK) {
            return issueInvoice(*order, customerId, transactionId, amount);
        }
        return chargeGateway(*order, customerId, methodCode, *kind, request, transactionId, amount);
    }

    std::vector<domain::PaymentMethod> getPaymentMethods() override {
        return methods_->listActiveMethods();
    }

private:
    std::shared_ptr<ports::output::ICustomerDirectory> customers_;
    std::shared_ptr<ports::output::IPaymentMethodRegistry> methods_;
    std::shared_ptr<ports::output::IOrderStore> orderStore_;
    std::shared_ptr<ports::output::ITransactionLedger> ledger_;
    std::shared_ptr<ports::output::IUnitOfWork> unitOfWork_;
    std::shared_ptr<ports::output::IPaymentGateway> gateway_;
    std::shared_ptr<ports::output::IEventPublisher> eventPublisher_;
    std::shared_ptr<settings::PaymentSettings> settings_;
    InvoiceGenerator invoiceGenerator_;
    std::mt19937 rng_;
    std::mutex rngMutex_;

    static void validateCard(const std::optional<domain::CardDetails>& card) {
        if (!card) {
            throw domain::ValidationError("Card details are required");
        }
        if (card->holder.empty()) {
            throw domain::ValidationError("Card holder name is required");
        }
        if (card->cardNumber.empty()) {
            throw domain::ValidationError("Card number is required");
        }
        if (card->monthExpire < 1 || card->monthExpire > 12) {
            throw domain::ValidationError("Expiration month must be between 1 and 12");
        }
        if (card->yearExpire < 2024 || card->yearExpire > 2099) {
            throw domain::ValidationError("Expiration year must be between 2024 and 2099");
        }
        if (card->cvv2 < 100 || card->cvv2 > 9999) {
            throw domain::ValidationError("CVV must be between 100 and 9999");
        }
    }

    struct Checkout {
        std::string transactionId;
        domain::Money amount;
    };

    /**
     * @brief Единица работы #1: забрать корзину и открыть транзакцию
     *
     * Сумма считается после перевода в CHECKOUT, по уже неизменяемым позициям.
     */
    Checkout beginCheckout(
        const domain::Order& order,
        const std::string& customerId,
        const std::string& methodCode,
        domain::PaymentMethodKind kind)
    {
        UnitOfWorkScope unit(*unitOfWork_);

        auto next = domain::OrderStateMachine::next(order.status, domain::OrderEvent::CHECKOUT_STARTED);
        if (!orderStore_->compareAndSetStatus(order.id, order.status, next)) {
            unit.rollback();
            std::cout << "[PaymentService] CONFLICT: order " << order.id
                      << " already left OPEN" << std::endl;
            throw domain::ConflictError("Order " + order.id + " is already being paid");
        }

        if (orderStore_->getOrderLines(order.id).empty()) {
            unit.rollback();
            throw domain::ValidationError("Cart is empty");
        }
        domain::Money amount = orderStore_->computeOrderTotal(order.id);

        auto initialStatus = (kind == domain::PaymentMethodKind::BANK)
            ? domain::PaymentStatus::PENDING
            : domain::PaymentStatus::PROCESSING;

        std::string transactionId = ledger_->createTransaction(
            order.id, customerId, methodCode, amount, initialStatus);

        unit.commit();

        std::cout << "[PaymentService] Order " << order.id << " -> CHECKOUT, transaction "
                  << transactionId << " (" << domain::toString(initialStatus) << "), amount "
                  << amount.toString() << std::endl;
        return {transactionId, amount};
    }

    // ============================================
    // BANK
    // ============================================

    domain::PaymentResult issueInvoice(
        const domain::Order& order,
        const std::string& customerId,
        const std::string& transactionId,
        const domain::Money& amount)
    {
        domain::BankInvoice invoice;
        invoice.customerId = customerId;
        invoice.orderId = order.id;
        invoice.amount = amount;
        invoice.createdAt = domain::Timestamp::now().truncatedToSeconds();
        invoice.validUntil = invoice.createdAt.plusDays(settings_->getInvoiceValidityDays());

        domain::BankInvoiceDocument document;
        document.document = invoiceGenerator_.render(invoice);
        document.fileName = InvoiceGenerator::fileName(order.id);
        document.validUntil = invoice.validUntil;

        domain::PaymentResult result;
        result.success = true;
        result.method = domain::PaymentMethodKind::BANK;
        result.message = "Invoice issued";
        result.orderId = order.id;
        result.transactionId = transactionId;
        result.amount = amount;
        result.invoice = document;

        domain::InvoiceIssuedEvent event;
        event.eventId = generateEventId();
        event.orderId = order.id;
        event.customerId = customerId;
        event.transactionId = transactionId;
        event.amount = amount;
        event.validUntil = invoice.validUntil;
        publish(event);

        std::cout << "[PaymentService] Invoice issued for order " << order.id
                  << ", valid until " << invoice.validUntil.toDisplayString() << std::endl;
        return result;
    }

    // ============================================
    // TERMINAL / CARD
    // ============================================

    domain::PaymentResult chargeGateway(
        const domain::Order& order,
        const std::string& customerId,
        const std::string& methodCode,
        domain::PaymentMethodKind kind,
        const domain::PaymentRequest& request,
        const std::string& transactionId,
        const domain::Money& amount)
    {
        domain::GatewayRequest gatewayRequest;
        gatewayRequest.endpoint = (kind == domain::PaymentMethodKind::CARD)
            ? domain::GatewayEndpoint::CARD
            : domain::GatewayEndpoint::TERMINAL;
        gatewayRequest.idempotencyKey = transactionId;
        gatewayRequest.amount = amount;
        gatewayRequest.customerId = customerId;
        gatewayRequest.orderId = order.id;
        if (kind == domain::PaymentMethodKind::CARD) {
            gatewayRequest.card = request.card;
        }

        domain::GatewayResponse response;
        try {
            response = gateway_->charge(gatewayRequest);
        } catch (const domain::GatewayTransportError& e) {
            std::cerr << "[PaymentService] Gateway unreachable for order " << order.id
                      << ", left in CHECKOUT for reconciliation: " << e.what() << std::endl;
            recordTransportFault(transactionId, e.what());
            throw;
        } catch (const std::exception& e) {
            // Исход списания неизвестен: как и при сбое транспорта, заказ ждёт сверки
            std::cerr << "[PaymentService] Unexpected gateway error for order " << order.id
                      << ", left in CHECKOUT for reconciliation: " << e.what() << std::endl;
            recordTransportFault(transactionId, e.what());
            throw;
        }

        domain::PaymentResult result;
        result.method = kind;
        result.orderId = order.id;
        result.transactionId = transactionId;
        result.amount = amount;

        if (response.approved) {
            settle(order.id, transactionId, domain::PaymentStatus::COMPLETED,
                   response.externalTransactionId.empty()
                       ? std::nullopt
                       : std::optional<std::string>(response.externalTransactionId),
                   std::nullopt,
                   domain::OrderEvent::PAYMENT_SUCCEEDED);

            result.success = true;
            result.message = "Payment completed";
            if (kind == domain::PaymentMethodKind::TERMINAL) {
                domain::PaymentReceipt receipt;
                receipt.customerId = customerId;
                receipt.orderId = order.id;
                receipt.paymentDate = domain::Timestamp::now();
                receipt.sum = amount;
                result.receipt = receipt;
            }

            domain::PaymentCompletedEvent event;
            event.eventId = generateEventId();
            event.orderId = order.id;
            event.customerId = customerId;
            event.transactionId = transactionId;
            event.paymentMethod = methodCode;
            event.externalTransactionId = response.externalTransactionId;
            event.amount = amount;
            publish(event);

            std::cout << "[PaymentService] Order " << order.id << " PAID" << std::endl;
        } else {
            std::string reason = response.message.empty()
                ? "Payment declined by gateway (HTTP " + std::to_string(response.httpStatus) + ")"
                : response.message;

            settle(order.id, transactionId, domain::PaymentStatus::FAILED,
                   std::nullopt, reason, domain::OrderEvent::PAYMENT_FAILED);

            result.success = false;
            result.message = reason;

            domain::PaymentFailedEvent event;
            event.eventId = generateEventId();
            event.orderId = order.id;
            event.customerId = customerId;
            event.transactionId = transactionId;
            event.paymentMethod = methodCode;
            event.reason = reason;
            event.amount = amount;
            publish(event);

            std::cout << "[PaymentService] Order " << order.id << " CANCELLED: " << reason << std::endl;
        }

        return result;
    }

    /**
     * @brief Единица работы #2: финальный статус транзакции и заказа
     */
    void settle(
        const std::string& orderId,
        const std::string& transactionId,
        domain::PaymentStatus paymentStatus,
        const std::optional<std::string>& externalTransactionId,
        const std::optional<std::string>& errorMessage,
        domain::OrderEvent orderEvent)
    {
        UnitOfWorkScope unit(*unitOfWork_);

        auto next = domain::OrderStateMachine::next(domain::OrderStatus::CHECKOUT, orderEvent);

        if (!ledger_->updateTransactionStatus(transactionId, paymentStatus,
                                              externalTransactionId, errorMessage)) {
            throw domain::ConflictError("Transaction " + transactionId + " is already finalized");
        }
        if (!orderStore_->compareAndSetStatus(orderId, domain::OrderStatus::CHECKOUT, next)) {
            throw domain::ConflictError("Order " + orderId + " is not in CHECKOUT");
        }

        unit.commit();
    }

    void recordTransportFault(const std::string& transactionId, const std::string& error) {
        try {
            UnitOfWorkScope unit(*unitOfWork_);
            if (!ledger_->updateTransactionStatus(transactionId, domain::PaymentStatus::PROCESSING,
                                                  std::nullopt, error)) {
                std::cerr << "[PaymentService] Transaction " << transactionId
                          << " is already finalized, gateway fault not recorded" << std::endl;
                return;
            }
            unit.commit();
        } catch (const std::exception& e) {
            std::cerr << "[PaymentService] Failed to record gateway fault for "
                      << transactionId << ": " << e.what() << std::endl;
        }
    }

    void publish(const domain::DomainEvent& event) {
        try {
            eventPublisher_->publish(event.eventType, event.toJson());
        } catch (const std::exception& e) {
            std::cerr << "[PaymentService] Failed to publish " << event.eventType
                      << ": " << e.what() << std::endl;
        }
    }

    std::string generateEventId() {
        std::lock_guard<std::mutex> lock(rngMutex_);
        std::uniform_int_distribution<uint64_t> dist(0, UINT64_MAX);

        std::stringstream ss;
        ss << "evt-" << std::hex << std::setfill('0') << std::setw(16) << dist(rng_);
        return ss.str();
    }
};

} // namespace payment::application
