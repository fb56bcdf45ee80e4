#pragma once

#include "ports/output/ICustomerDirectory.hpp"
#include "settings/AuthClientSettings.hpp"
#include <IHttpClient.hpp>
#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <memory>
#include <iostream>
#include <stdexcept>

namespace payment::adapters::secondary {

/**
 * @brief Проверка существования покупателя через Auth Service
 *
 * GET /api/v1/users/{id}: 200 → есть, 404 → нет, иначе ошибка.
 */
class HttpCustomerDirectory : public ports::output::ICustomerDirectory {
public:
    HttpCustomerDirectory(
        std::shared_ptr<IHttpClient> httpClient,
        std::shared_ptr<settings::AuthClientSettings> settings
    ) : httpClient_(std::move(httpClient))
      , settings_(std::move(settings))
    {}

    bool exists(const std::string& customerId) override {
        SimpleRequest request(
            "GET",
            settings_->getUserPath(customerId),
            "",
            settings_->getHost(),
            settings_->getPort(),
            {}
        );

        SimpleResponse response;
        if (!httpClient_->send(request, response)) {
            throw std::runtime_error("Auth service unreachable");
        }

        if (response.getStatus() == 200) {
            return true;
        }
        if (response.getStatus() == 404) {
            return false;
        }

        std::cerr << "[HttpCustomerDirectory] Unexpected status " << response.getStatus()
                  << " for " << customerId << std::endl;
        throw std::runtime_error("Auth service returned " + std::to_string(response.getStatus()));
    }

private:
    std::shared_ptr<IHttpClient> httpClient_;
    std::shared_ptr<settings::AuthClientSettings> settings_;
};

} // namespace payment::adapters::secondary
