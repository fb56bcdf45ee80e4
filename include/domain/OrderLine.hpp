#pragma once

#include "Money.hpp"
#include "Timestamp.hpp"
#include <string>
#include <cstdint>

namespace payment::domain {

/**
 * @brief Позиция заказа (товар в корзине)
 *
 * Цена и скидка фиксируются в момент добавления в корзину.
 */
class OrderLine {
public:
    std::string id;
    std::string orderId;
    std::string productId;
    std::string productKey;
    std::string productName;
    int64_t quantity = 0;
    Money unitPrice;
    int discountPercent = 0;    // 0-100
    Timestamp createdAt;
    Timestamp updatedAt;

    OrderLine() = default;

    OrderLine(const std::string& orderId_, const std::string& productId_,
              const std::string& key, const std::string& name,
              int64_t qty, const Money& price, int discount)
        : orderId(orderId_)
        , productId(productId_)
        , productKey(key)
        , productName(name)
        , quantity(qty)
        , unitPrice(price)
        , discountPercent(discount)
        , createdAt(Timestamp::now())
        , updatedAt(Timestamp::now())
    {}

    /**
     * @brief unitPrice × quantity × (1 − discount/100)
     */
    Money lineTotal() const {
        return (unitPrice * quantity).discounted(discountPercent);
    }
};

} // namespace payment::domain
