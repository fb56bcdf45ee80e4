#pragma once

#include <IHttpHandler.hpp>
#include "ports/output/IAuthClient.hpp"
#include "adapters/primary/HttpUtils.hpp"
#include <memory>
#include <iostream>

namespace payment::adapters::primary {

/**
 * @brief Middleware: Bearer токен → атрибут "customerId"
 *
 * Без токена или с невалидным токеном отвечает 401.
 */
class CustomerIdExtractorMiddleware : public IHttpHandler {
public:
    explicit CustomerIdExtractorMiddleware(std::shared_ptr<ports::output::IAuthClient> authClient)
        : authClient_(std::move(authClient))
    {
        std::cout << "[CustomerIdExtractorMiddleware] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        std::string token = req.getBearerToken().value_or("");
        if (token.empty()) {
            sendError(res, 401, "Access token required");
            return;
        }

        auto customerId = authClient_->getCustomerIdFromToken(token).value_or("");
        if (customerId.empty()) {
            sendError(res, 401, "Token not valid");
            return;
        }

        req.setAttribute("customerId", customerId);
        res.setStatus(0); // для middleware
    }

private:
    std::shared_ptr<ports::output::IAuthClient> authClient_;
};

} // namespace payment::adapters::primary
