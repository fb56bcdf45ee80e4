#pragma once

#include "ports/output/IAuthClient.hpp"
#include "settings/AuthClientSettings.hpp"
#include <IHttpClient.hpp>
#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>
#include <initializer_list>

namespace payment::adapters::secondary {

/**
 * @brief Разрешение access токена покупателя через Auth Service
 *
 * POST /api/v1/auth/validate { "token": "...", "type": "access" }
 *   200 { "valid": true, "user_id": "...", "message": "..." }
 *   401 / 403 → токен отклонён
 *
 * Id покупателя берётся из первого непустого claim: user_id, sub.
 * Сбой сети или нечитаемый ответ трактуются как невалидный токен.
 */
class HttpAuthClient : public ports::output::IAuthClient {
public:
    HttpAuthClient(
        std::shared_ptr<IHttpClient> httpClient,
        std::shared_ptr<settings::AuthClientSettings> settings
    ) : httpClient_(std::move(httpClient))
      , settings_(std::move(settings))
    {
        std::cout << "[HttpAuthClient] Created, target: "
                  << settings_->getHost() << ":" << settings_->getPort() << std::endl;
    }

    ports::output::TokenValidationResult validateAccessToken(const std::string& token) override {
        nlohmann::json body = {
            {"token", token},
            {"type", "access"}
        };

        SimpleRequest request(
            "POST",
            settings_->getValidatePath(),
            body.dump(),
            settings_->getHost(),
            settings_->getPort(),
            {{"Content-Type", "application/json"}}
        );
        SimpleResponse response;

        try {
            if (!httpClient_->send(request, response)) {
                return rejected("Auth service unreachable");
            }
        } catch (const std::exception& e) {
            std::cerr << "[HttpAuthClient] Error: " << e.what() << std::endl;
            return rejected(std::string("Auth service error: ") + e.what());
        }

        int status = response.getStatus();
        if (status == 401 || status == 403) {
            return rejected("Token rejected by auth service");
        }
        if (status != 200) {
            std::cerr << "[HttpAuthClient] Unexpected status " << status << std::endl;
            return rejected("Auth service returned " + std::to_string(status));
        }

        auto json = nlohmann::json::parse(response.getBody(), nullptr, false);
        if (json.is_discarded() || !json.is_object()) {
            std::cerr << "[HttpAuthClient] Malformed validate response" << std::endl;
            return rejected("Malformed auth service response");
        }

        ports::output::TokenValidationResult result;
        auto valid = json.find("valid");
        result.valid = valid != json.end() && valid->is_boolean() && valid->get<bool>();
        result.customerId = firstClaim(json, {"user_id", "sub"});

        auto message = json.find("message");
        if (message != json.end() && message->is_string()) {
            result.message = message->get<std::string>();
        }
        return result;
    }

    std::optional<std::string> getCustomerIdFromToken(const std::string& token) override {
        auto result = validateAccessToken(token);
        if (result.valid && !result.customerId.empty()) {
            return result.customerId;
        }
        return std::nullopt;
    }

private:
    std::shared_ptr<IHttpClient> httpClient_;
    std::shared_ptr<settings::AuthClientSettings> settings_;

    static ports::output::TokenValidationResult rejected(const std::string& message) {
        ports::output::TokenValidationResult result;
        result.valid = false;
        result.message = message;
        return result;
    }

    // Строковые и числовые id; пустые значения пропускаются
    static std::string firstClaim(const nlohmann::json& json,
                                  std::initializer_list<const char*> names) {
        for (const char* name : names) {
            auto it = json.find(name);
            if (it == json.end()) {
                continue;
            }
            if (it->is_string() && !it->get<std::string>().empty()) {
                return it->get<std::string>();
            }
            if (it->is_number_integer()) {
                return it->dump();
            }
        }
        return "";
    }
};

} // namespace payment::adapters::secondary
