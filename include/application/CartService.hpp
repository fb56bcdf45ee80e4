#pragma once

#include "ports/input/ICartService.hpp"
#include "ports/output/ICatalogClient.hpp"
#include "ports/output/IOrderStore.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include "application/UnitOfWorkScope.hpp"
#include "domain/Errors.hpp"
#include <memory>
#include <iostream>
#include <algorithm>

namespace payment::application {

/**
 * @brief Сервис корзины (OPEN заказа покупателя)
 *
 * Каждая мутация выполняется в отдельной единице работы.
 * Корзина создаётся при первом добавлении и удаляется, когда становится пустой.
 */
class CartService : public ports::input::ICartService {
public:
    CartService(
        std::shared_ptr<ports::output::ICatalogClient> catalog,
        std::shared_ptr<ports::output::IOrderStore> orderStore,
        std::shared_ptr<ports::output::IUnitOfWork> unitOfWork
    ) : catalog_(std::move(catalog))
      , orderStore_(std::move(orderStore))
      , unitOfWork_(std::move(unitOfWork))
    {
        std::cout << "[CartService] Created" << std::endl;
    }

    void addItem(const std::string& customerId, const std::string& productKey,
                 int64_t quantity = 1) override
    {
        if (quantity < 1) {
            throw domain::ValidationError("Quantity must be at least 1");
        }

        auto product = catalog_->findProduct(productKey);
        if (!product) {
            throw domain::NotFoundError("Game not found: " + productKey);
        }
        checkStock(*product, quantity);

        UnitOfWorkScope unit(*unitOfWork_);

        auto order = orderStore_->getOrCreateOpenOrder(customerId);
        auto existing = findLine(order.lines, productKey);

        domain::OrderLine line;
        if (existing) {
            line = *existing;
            line.quantity += quantity;
            checkStock(*product, line.quantity);
        } else {
            line = domain::OrderLine(order.id, product->productId, product->key, product->name,
                                     quantity, product->price, product->discount);
        }

        orderStore_->upsertLine(line);
        unit.commit();

        std::cout << "[CartService] " << customerId << ": " << productKey
                  << " x" << line.quantity << " in cart " << order.id << std::endl;
    }

    void updateQuantity(const std::string& customerId, const std::string& productKey,
                        int64_t quantity) override
    {
        // Быстрые проверки до единицы работы: каталог опрашивается вне её
        auto current = requireCart(customerId);
        if (!findLine(current.lines, productKey)) {
            throw domain::NotFoundError("Game " + productKey + " is not in the cart");
        }

        if (quantity > 0) {
            auto product = catalog_->findProduct(productKey);
            if (!product) {
                throw domain::NotFoundError("Game not found: " + productKey);
            }
            checkStock(*product, quantity);
        }

        UnitOfWorkScope unit(*unitOfWork_);
        auto order = requireCart(customerId);
        if (!orderStore_->setLineQuantity(order.id, productKey, quantity)) {
            throw domain::NotFoundError("Game " + productKey + " is not in the cart");
        }
        if (quantity <= 0) {
            deleteIfEmpty(order.id);
        }
        unit.commit();
    }

    void removeItem(const std::string& customerId, const std::string& productKey) override {
        UnitOfWorkScope unit(*unitOfWork_);

        auto order = requireCart(customerId);
        if (!orderStore_->removeLine(order.id, productKey)) {
            throw domain::NotFoundError("Game " + productKey + " is not in the cart");
        }
        deleteIfEmpty(order.id);
        unit.commit();
    }

    std::vector<domain::OrderLine> getCart(const std::string& customerId) override {
        auto order = orderStore_->getOpenOrderForCustomer(customerId);
        if (!order) {
            return {};
        }
        return order->lines;
    }

    /**
     * @brief Удалить активную корзину
     *
     * Заказ, который уже ушёл в оплату, корзиной не считается и не удаляется.
     */
    void clearCart(const std::string& customerId) override {
        UnitOfWorkScope unit(*unitOfWork_);

        auto order = orderStore_->getOpenOrderForCustomer(customerId);
        if (!order) {
            unit.rollback();
            return;
        }

        if (orderStore_->deleteOrder(order->id)) {
            std::cout << "[CartService] Cart " << order->id << " cleared" << std::endl;
        } else {
            std::cout << "[CartService] Cart " << order->id
                      << " already left OPEN, nothing to clear" << std::endl;
        }
        unit.commit();
    }

private:
    std::shared_ptr<ports::output::ICatalogClient> catalog_;
    std::shared_ptr<ports::output::IOrderStore> orderStore_;
    std::shared_ptr<ports::output::IUnitOfWork> unitOfWork_;

    domain::Order requireCart(const std::string& customerId) {
        auto order = orderStore_->getOpenOrderForCustomer(customerId);
        if (!order) {
            throw domain::NotFoundError("No active cart found");
        }
        return *order;
    }

    static std::optional<domain::OrderLine> findLine(
        const std::vector<domain::OrderLine>& lines, const std::string& productKey)
    {
        auto it = std::find_if(lines.begin(), lines.end(),
            [&](const domain::OrderLine& l) { return l.productKey == productKey; });
        if (it == lines.end()) {
            return std::nullopt;
        }
        return *it;
    }

    static void checkStock(const domain::ProductSnapshot& product, int64_t requested) {
        if (requested > product.unitsInStock) {
            throw domain::ValidationError(
                "Insufficient stock for " + product.key + ": requested " + std::to_string(requested) +
                ", available " + std::to_string(product.unitsInStock));
        }
    }

    void deleteIfEmpty(const std::string& orderId) {
        if (!orderStore_->getOrderLines(orderId).empty()) {
            return;
        }
        if (!orderStore_->deleteOrder(orderId)) {
            throw domain::ConflictError("Order " + orderId + " is not open");
        }
        std::cout << "[CartService] Cart " << orderId << " is empty, deleted" << std::endl;
    }
};

} // namespace payment::application
