#pragma once

#include "domain/OrderLine.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace payment::ports::input {

/**
 * @brief Интерфейс сервиса корзины
 */
class ICartService {
public:
    virtual ~ICartService() = default;

    virtual void addItem(const std::string& customerId, const std::string& productKey,
                         int64_t quantity = 1) = 0;

    virtual void updateQuantity(const std::string& customerId, const std::string& productKey,
                                int64_t quantity) = 0;

    virtual void removeItem(const std::string& customerId, const std::string& productKey) = 0;

    /**
     * @brief Позиции активной корзины (пусто, если корзины нет)
     */
    virtual std::vector<domain::OrderLine> getCart(const std::string& customerId) = 0;

    virtual void clearCart(const std::string& customerId) = 0;
};

} // namespace payment::ports::input
