#pragma once

#include "Money.hpp"
#include <string>
#include <cstdint>

namespace payment::domain {

/**
 * @brief Данные товара из каталога на момент добавления в корзину
 */
struct ProductSnapshot {
    std::string productId;
    std::string key;
    std::string name;
    Money price;
    int discount = 0;
    int64_t unitsInStock = 0;
};

} // namespace payment::domain
