#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IPaymentService.hpp"
#include "adapters/primary/HttpUtils.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace payment::adapters::primary {

/**
 * @brief POST /api/orders/payment - оплата активной корзины
 *
 * Request:
 * {
 *   "method": "Visa",
 *   "model": { "holder": "...", "cardNumber": "...", "monthExpire": 12,
 *              "yearExpire": 2030, "cvv2": 123 }      // только для Visa
 * }
 *
 * Response 200:
 * - Bank: текстовый счёт, Content-Disposition: attachment
 * - IBox terminal: квитанция { userId, orderId, paymentDate, sum }
 * - Visa: { "success": true }
 *
 * 402 - отказ шлюза (заказ отменён), 502 - исход платежа неизвестен.
 * Ожидает атрибут "customerId" от CustomerIdExtractorMiddleware.
 */
class ProcessPaymentHandler : public IHttpHandler {
public:
    explicit ProcessPaymentHandler(std::shared_ptr<ports::input::IPaymentService> paymentService)
        : paymentService_(std::move(paymentService))
    {
        std::cout << "[ProcessPaymentHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "POST") {
            sendError(res, 405, "Method not allowed");
            return;
        }

        std::string customerId = req.getAttribute("customerId").value_or("");
        if (customerId.empty()) {
            sendError(res, 401, "Access token required");
            return;
        }

        domain::PaymentRequest request;
        try {
            request = parseRequest(req.getBody());
        } catch (const nlohmann::json::exception& e) {
            sendError(res, 400, "Invalid JSON");
            return;
        }
        if (request.method.empty()) {
            sendError(res, 400, "Payment method is required");
            return;
        }

        try {
            auto result = paymentService_->processPayment(customerId, request);
            writeResult(res, result);

        } catch (const domain::PaymentServiceError& e) {
            int status = httpStatusFor(e);
            if (status >= 500) {
                std::cerr << "[ProcessPaymentHandler] " << e.what() << std::endl;
            }
            sendError(res, status, e.what());
        } catch (const std::exception& e) {
            std::cerr << "[ProcessPaymentHandler] Error: " << e.what() << std::endl;
            sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::IPaymentService> paymentService_;

    static domain::PaymentRequest parseRequest(const std::string& body) {
        auto j = nlohmann::json::parse(body);

        domain::PaymentRequest request(j.value("method", ""));
        if (j.contains("model") && j["model"].is_object()) {
            const auto& model = j["model"];
            domain::CardDetails card;
            card.holder = model.value("holder", "");
            card.cardNumber = model.value("cardNumber", "");
            card.monthExpire = model.value("monthExpire", 0);
            card.yearExpire = model.value("yearExpire", 0);
            card.cvv2 = model.value("cvv2", 0);
            request.card = card;
        }
        return request;
    }

    static void writeResult(IResponse& res, const domain::PaymentResult& result) {
        if (!result.success) {
            nlohmann::json error;
            error["error"] = result.message;
            error["orderId"] = result.orderId;
            error["transactionId"] = result.transactionId;
            res.setResult(402, "application/json", error.dump());
            return;
        }

        if (result.invoice) {
            res.setStatus(200);
            res.setHeader("Content-Type", "text/plain; charset=utf-8");
            res.setHeader("Content-Disposition",
                          "attachment; filename=\"" + result.invoice->fileName + "\"");
            res.setBody(result.invoice->document);
            return;
        }

        if (result.receipt) {
            nlohmann::json receipt;
            receipt["userId"] = result.receipt->customerId;
            receipt["orderId"] = result.receipt->orderId;
            receipt["paymentDate"] = result.receipt->paymentDate.toString();
            receipt["sum"] = result.receipt->sum.toDouble();
            res.setResult(200, "application/json", receipt.dump());
            return;
        }

        nlohmann::json response;
        response["success"] = true;
        res.setResult(200, "application/json", response.dump());
    }
};

} // namespace payment::adapters::primary
