#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IOrderQueryService.hpp"
#include "adapters/primary/HttpUtils.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace payment::adapters::primary {

/**
 * @brief HTTP Handler истории заказов
 *
 * Endpoints:
 * - GET /api/orders                    → все заказы покупателя
 * - GET /api/orders/history            → оплаченные и отменённые
 * - GET /api/orders/{id}               → заказ с позициями
 * - GET /api/orders/{id}/transactions  → попытки оплаты заказа
 */
class OrderHistoryHandler : public IHttpHandler {
public:
    explicit OrderHistoryHandler(std::shared_ptr<ports::input::IOrderQueryService> queryService)
        : queryService_(std::move(queryService))
    {
        std::cout << "[OrderHistoryHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "GET") {
            sendError(res, 405, "Method not allowed");
            return;
        }

        std::string customerId = req.getAttribute("customerId").value_or("");
        if (customerId.empty()) {
            sendError(res, 401, "Access token required");
            return;
        }

        auto segments = splitPath(req.getPath());
        if (segments.size() < 2 || segments[0] != "api" || segments[1] != "orders") {
            sendError(res, 404, "Not found");
            return;
        }

        try {
            if (segments.size() == 2) {
                sendOrders(res, queryService_->getOrders(customerId));
            } else if (segments.size() == 3 && segments[2] == "history") {
                sendOrders(res, queryService_->getOrderHistory(customerId));
            } else if (segments.size() == 3) {
                auto order = queryService_->getOrder(customerId, segments[2]);
                res.setResult(200, "application/json", orderToJson(order, true).dump());
            } else if (segments.size() == 4 && segments[3] == "transactions") {
                auto transactions = queryService_->getTransactions(customerId, segments[2]);

                nlohmann::json items = nlohmann::json::array();
                for (const auto& tx : transactions) {
                    items.push_back(transactionToJson(tx));
                }
                nlohmann::json response;
                response["transactions"] = items;
                res.setResult(200, "application/json", response.dump());
            } else {
                sendError(res, 404, "Not found");
            }

        } catch (const domain::PaymentServiceError& e) {
            sendError(res, httpStatusFor(e), e.what());
        } catch (const std::exception& e) {
            std::cerr << "[OrderHistoryHandler] Error: " << e.what() << std::endl;
            sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::IOrderQueryService> queryService_;

    void sendOrders(IResponse& res, const std::vector<domain::Order>& orders) {
        nlohmann::json response;
        response["orders"] = nlohmann::json::array();
        for (const auto& order : orders) {
            response["orders"].push_back(orderToJson(order, false));
        }
        res.setResult(200, "application/json", response.dump());
    }

    nlohmann::json orderToJson(const domain::Order& order, bool withLines) {
        nlohmann::json j;
        j["id"] = order.id;
        j["customerId"] = order.customerId;
        j["status"] = domain::toString(order.status);
        j["total"] = order.total().toDouble();
        j["createdAt"] = order.createdAt.toString();
        j["updatedAt"] = order.updatedAt.toString();
        if (order.finalizedAt) {
            j["date"] = order.finalizedAt->toString();
        }
        if (withLines) {
            j["lines"] = nlohmann::json::array();
            for (const auto& line : order.lines) {
                j["lines"].push_back({
                    {"productId", line.productId},
                    {"key", line.productKey},
                    {"name", line.productName},
                    {"quantity", line.quantity},
                    {"price", line.unitPrice.toDouble()},
                    {"discount", line.discountPercent}
                });
            }
        }
        return j;
    }

    nlohmann::json transactionToJson(const domain::PaymentTransaction& tx) {
        nlohmann::json j;
        j["id"] = tx.id;
        j["orderId"] = tx.orderId;
        j["paymentMethod"] = tx.paymentMethod;
        j["amount"] = tx.amount.toDouble();
        j["currency"] = tx.amount.currency;
        j["status"] = domain::toString(tx.status);
        j["processedAt"] = tx.processedAt.toString();
        if (tx.externalTransactionId) {
            j["externalTransactionId"] = *tx.externalTransactionId;
        }
        if (tx.errorMessage) {
            j["errorMessage"] = *tx.errorMessage;
        }
        return j;
    }
};

} // namespace payment::adapters::primary
