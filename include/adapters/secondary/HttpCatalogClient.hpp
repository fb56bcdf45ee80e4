#pragma once

#include "ports/output/ICatalogClient.hpp"
#include "settings/CatalogClientSettings.hpp"
#include <IHttpClient.hpp>
#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>
#include <stdexcept>

namespace payment::adapters::secondary {

/**
 * @brief HTTP клиент к Catalog Service
 *
 * GET /api/games/{key} → {id, key, name, price, discount, unitInStock}
 */
class HttpCatalogClient : public ports::output::ICatalogClient {
public:
    HttpCatalogClient(
        std::shared_ptr<IHttpClient> httpClient,
        std::shared_ptr<settings::CatalogClientSettings> settings
    ) : httpClient_(std::move(httpClient))
      , settings_(std::move(settings))
    {
        std::cout << "[HttpCatalogClient] Created, target: "
                  << settings_->getHost() << ":" << settings_->getPort() << std::endl;
    }

    std::optional<domain::ProductSnapshot> findProduct(const std::string& productKey) override {
        SimpleRequest request(
            "GET",
            "/api/games/" + productKey,
            "",
            settings_->getHost(),
            settings_->getPort(),
            {}
        );

        SimpleResponse response;
        if (!httpClient_->send(request, response)) {
            throw std::runtime_error("Catalog service unreachable");
        }

        if (response.getStatus() == 404) {
            return std::nullopt;
        }
        if (response.getStatus() != 200) {
            std::cerr << "[HttpCatalogClient] findProduct " << productKey
                      << " failed: " << response.getStatus() << std::endl;
            throw std::runtime_error("Catalog service returned " + std::to_string(response.getStatus()));
        }

        auto j = nlohmann::json::parse(response.getBody());

        domain::ProductSnapshot product;
        product.productId = j.value("id", "");
        product.key = j.value("key", productKey);
        product.name = j.value("name", "");
        product.price = domain::Money::fromDouble(j.value("price", 0.0), j.value("currency", "USD"));
        product.discount = j.value("discount", 0);
        product.unitsInStock = j.value("unitInStock", int64_t{0});
        return product;
    }

private:
    std::shared_ptr<IHttpClient> httpClient_;
    std::shared_ptr<settings::CatalogClientSettings> settings_;
};

} // namespace payment::adapters::secondary
