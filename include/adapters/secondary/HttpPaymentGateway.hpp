#pragma once

#include "ports/output/IPaymentGateway.hpp"
#include "settings/IGatewayClientSettings.hpp"
#include "domain/Errors.hpp"
#include <IHttpClient.hpp>
#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>
#include <stdexcept>

namespace payment::adapters::secondary {

/**
 * @brief HTTP клиент к внешнему платёжному шлюзу
 *
 * POST {cardPath}     - оплата картой
 * POST {terminalPath} - оплата через терминал
 *
 * Каждый запрос несёт заголовок X-Idempotency-Key.
 * 2xx → approved, любой другой статус → отказ. Тело ответа на решение не влияет.
 * send() == false или исключение клиента → GatewayTransportError.
 */
class HttpPaymentGateway : public ports::output::IPaymentGateway {
public:
    HttpPaymentGateway(
        std::shared_ptr<IHttpClient> httpClient,
        std::shared_ptr<settings::IGatewayClientSettings> settings
    ) : httpClient_(std::move(httpClient))
      , settings_(std::move(settings))
    {
        std::cout << "[HttpPaymentGateway] Created, target: "
                  << settings_->getHost() << ":" << settings_->getPort() << std::endl;
    }

    domain::GatewayResponse charge(const domain::GatewayRequest& request) override {
        std::string path;
        nlohmann::json body;

        if (request.endpoint == domain::GatewayEndpoint::CARD) {
            if (!request.card) {
                throw std::invalid_argument("Card details are required for card payment");
            }
            path = settings_->getCardPath();
            body["transactionAmount"] = request.amount.toDouble();
            body["cardHolderName"] = request.card->holder;
            body["cardNumber"] = request.card->cardNumber;
            body["expirationMonth"] = request.card->monthExpire;
            body["expirationYear"] = request.card->yearExpire;
            body["cvv"] = request.card->cvv2;
            body["invoiceNumber"] = request.orderId;
        } else {
            path = settings_->getTerminalPath();
            body["transactionAmount"] = request.amount.toDouble();
            body["accountNumber"] = request.customerId;
            body["invoiceNumber"] = request.orderId;
        }

        SimpleRequest httpRequest(
            "POST",
            path,
            body.dump(),
            settings_->getHost(),
            settings_->getPort(),
            {
                {"Content-Type", "application/json"},
                {"X-Idempotency-Key", request.idempotencyKey}
            }
        );
        SimpleResponse httpResponse;

        bool sent = false;
        try {
            sent = httpClient_->send(httpRequest, httpResponse);
        } catch (const std::exception& e) {
            std::cerr << "[HttpPaymentGateway] POST " << path << " error: " << e.what() << std::endl;
            throw domain::GatewayTransportError(std::string("Payment gateway request failed: ") + e.what());
        }

        if (!sent) {
            std::cerr << "[HttpPaymentGateway] POST " << path << " not delivered" << std::endl;
            throw domain::GatewayTransportError(
                "Payment gateway unreachable: " + settings_->getHost() + ":" +
                std::to_string(settings_->getPort()));
        }

        domain::GatewayResponse response;
        response.httpStatus = httpResponse.getStatus();
        response.approved = response.httpStatus >= 200 && response.httpStatus < 300;

        auto json = nlohmann::json::parse(httpResponse.getBody(), nullptr, false);
        if (!json.is_discarded() && json.is_object()) {
            response.externalTransactionId = textField(json, "transactionId");
            response.message = textField(json, "message");
        }

        if (!response.approved && response.message.empty()) {
            response.message = "Payment declined by gateway (HTTP " +
                               std::to_string(response.httpStatus) + ")";
        }

        std::cout << "[HttpPaymentGateway] POST " << path << " key=" << request.idempotencyKey
                  << " -> " << response.httpStatus << std::endl;
        return response;
    }

private:
    std::shared_ptr<IHttpClient> httpClient_;
    std::shared_ptr<settings::IGatewayClientSettings> settings_;

    /**
     * @brief Строка или число как текст; прочие типы и отсутствие поля → ""
     */
    static std::string textField(const nlohmann::json& json, const char* key) {
        auto it = json.find(key);
        if (it == json.end()) {
            return "";
        }
        if (it->is_string()) {
            return it->get<std::string>();
        }
        if (it->is_number()) {
            return it->dump();
        }
        return "";
    }
};

} // namespace payment::adapters::secondary
