#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IPaymentService.hpp"
#include "adapters/primary/HttpUtils.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace payment::adapters::primary {

/**
 * @brief GET /api/orders/payment-methods (без авторизации)
 */
class GetPaymentMethodsHandler : public IHttpHandler {
public:
    explicit GetPaymentMethodsHandler(std::shared_ptr<ports::input::IPaymentService> paymentService)
        : paymentService_(std::move(paymentService))
    {
        std::cout << "[GetPaymentMethodsHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "GET") {
            sendError(res, 405, "Method not allowed");
            return;
        }

        try {
            nlohmann::json methods = nlohmann::json::array();
            for (const auto& m : paymentService_->getPaymentMethods()) {
                methods.push_back({
                    {"code", m.code},
                    {"title", m.title},
                    {"description", m.description},
                    {"imageUrl", m.imageUrl}
                });
            }

            nlohmann::json response;
            response["paymentMethods"] = methods;
            res.setResult(200, "application/json", response.dump());
        } catch (const std::exception& e) {
            std::cerr << "[GetPaymentMethodsHandler] Error: " << e.what() << std::endl;
            sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::IPaymentService> paymentService_;
};

} // namespace payment::adapters::primary
