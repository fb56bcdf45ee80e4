#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/ICartService.hpp"
#include "adapters/primary/HttpUtils.hpp"
#include "domain/Order.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace payment::adapters::primary {

/**
 * @brief HTTP Handler корзины
 *
 * Endpoints:
 * - GET    /api/orders/cart                 → позиции корзины
 * - DELETE /api/orders/cart                 → очистить корзину
 * - POST   /api/games/{key}/buy             → добавить товар { "quantity": 1 }
 * - PUT    /api/orders/cart/{key}/quantity  → изменить количество { "quantity": N }
 * - DELETE /api/orders/cart/{key}           → убрать товар
 *
 * Ожидает атрибут "customerId" от CustomerIdExtractorMiddleware.
 */
class CartHandler : public IHttpHandler {
public:
    explicit CartHandler(std::shared_ptr<ports::input::ICartService> cartService)
        : cartService_(std::move(cartService))
    {
        std::cout << "[CartHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        std::string customerId = req.getAttribute("customerId").value_or("");
        if (customerId.empty()) {
            sendError(res, 401, "Access token required");
            return;
        }

        std::string method = req.getMethod();
        auto segments = splitPath(req.getPath());

        try {
            // /api/orders/cart[/{key}[/quantity]]
            bool cartPath = segments.size() >= 3 && segments[0] == "api" &&
                            segments[1] == "orders" && segments[2] == "cart";
            // /api/games/{key}/buy
            bool buyPath = segments.size() == 4 && segments[0] == "api" &&
                           segments[1] == "games" && segments[3] == "buy";

            if (buyPath && method == "POST") {
                handleAddItem(req, res, customerId, segments[2]);
            } else if (cartPath && segments.size() == 3 && method == "GET") {
                handleGetCart(res, customerId);
            } else if (cartPath && segments.size() == 3 && method == "DELETE") {
                cartService_->clearCart(customerId);
                sendMessage(res, "Cart cleared");
            } else if (cartPath && segments.size() == 5 && segments[4] == "quantity" && method == "PUT") {
                handleUpdateQuantity(req, res, customerId, segments[3]);
            } else if (cartPath && segments.size() == 4 && method == "DELETE") {
                cartService_->removeItem(customerId, segments[3]);
                sendMessage(res, "Game removed from cart");
            } else {
                sendError(res, 404, "Not found");
            }

        } catch (const nlohmann::json::exception& e) {
            sendError(res, 400, "Invalid JSON");
        } catch (const domain::PaymentServiceError& e) {
            sendError(res, httpStatusFor(e), e.what());
        } catch (const std::exception& e) {
            std::cerr << "[CartHandler] Error: " << e.what() << std::endl;
            sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::ICartService> cartService_;

    void handleAddItem(IRequest& req, IResponse& res, const std::string& customerId,
                       const std::string& key)
    {
        int64_t quantity = 1;
        if (!req.getBody().empty()) {
            auto body = nlohmann::json::parse(req.getBody());
            quantity = body.value("quantity", int64_t{1});
        }

        cartService_->addItem(customerId, key, quantity);
        sendMessage(res, "Game added to cart");
    }

    void handleUpdateQuantity(IRequest& req, IResponse& res, const std::string& customerId,
                              const std::string& key)
    {
        auto body = nlohmann::json::parse(req.getBody());
        if (!body.contains("quantity")) {
            sendError(res, 400, "Quantity is required");
            return;
        }

        cartService_->updateQuantity(customerId, key, body["quantity"].get<int64_t>());
        sendMessage(res, "Quantity updated");
    }

    void handleGetCart(IResponse& res, const std::string& customerId) {
        auto lines = cartService_->getCart(customerId);

        nlohmann::json items = nlohmann::json::array();
        for (const auto& line : lines) {
            items.push_back({
                {"productId", line.productId},
                {"key", line.productKey},
                {"name", line.productName},
                {"quantity", line.quantity},
                {"price", line.unitPrice.toDouble()},
                {"discount", line.discountPercent},
                {"total", line.lineTotal().toDouble()}
            });
        }

        nlohmann::json response;
        response["items"] = items;
        response["total"] = domain::Order::computeTotal(lines).toDouble();
        res.setResult(200, "application/json", response.dump());
    }

    static void sendMessage(IResponse& res, const std::string& message) {
        nlohmann::json response;
        response["message"] = message;
        res.setResult(200, "application/json", response.dump());
    }
};

} // namespace payment::adapters::primary
