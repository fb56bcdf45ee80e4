#pragma once

#include "domain/ProductSnapshot.hpp"
#include <string>
#include <optional>

namespace payment::ports::output {

/**
 * @brief Клиент каталога товаров
 */
class ICatalogClient {
public:
    virtual ~ICatalogClient() = default;

    /**
     * @brief Найти товар по ключу
     * @return nullopt если товара нет
     */
    virtual std::optional<domain::ProductSnapshot> findProduct(const std::string& productKey) = 0;
};

} // namespace payment::ports::output
