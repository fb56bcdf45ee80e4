#pragma once

#include "ports/output/IPaymentMethodRegistry.hpp"
#include "domain/enums/PaymentMethodKind.hpp"
#include <vector>
#include <mutex>
#include <algorithm>
#include <iterator>

namespace payment::adapters::secondary {

/**
 * @brief Справочник методов оплаты в памяти (те же записи, что в db/schema.sql)
 */
class InMemoryPaymentMethodRegistry : public ports::output::IPaymentMethodRegistry {
public:
    InMemoryPaymentMethodRegistry() {
        methods_ = {
            {"Bank", "Bank", "Pay by invoice through your bank",
             "https://static.gamestore.local/payments/bank.png", true, 1},
            {"IBox terminal", "IBox terminal", "Pay at any IBox terminal",
             "https://static.gamestore.local/payments/ibox.png", true, 2},
            {"Visa", "Visa", "Pay with Visa card",
             "https://static.gamestore.local/payments/visa.png", true, 3},
        };
    }

    bool isMethodActive(const std::string& code) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto normalized = domain::normalizeMethodCode(code);
        return std::any_of(methods_.begin(), methods_.end(),
            [&](const domain::PaymentMethod& m) {
                return m.isActive && domain::normalizeMethodCode(m.code) == normalized;
            });
    }

    std::vector<domain::PaymentMethod> listActiveMethods() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++listCallCount_;

        std::vector<domain::PaymentMethod> result;
        std::copy_if(methods_.begin(), methods_.end(), std::back_inserter(result),
            [](const domain::PaymentMethod& m) { return m.isActive; });
        std::sort(result.begin(), result.end(),
            [](const domain::PaymentMethod& a, const domain::PaymentMethod& b) {
                return a.displayOrder < b.displayOrder;
            });
        return result;
    }

    /**
     * @brief Включить / выключить метод (для тестов и локального запуска)
     */
    void setActive(const std::string& code, bool active) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto normalized = domain::normalizeMethodCode(code);
        for (auto& m : methods_) {
            if (domain::normalizeMethodCode(m.code) == normalized) {
                m.isActive = active;
            }
        }
    }

    void addMethod(const domain::PaymentMethod& method) {
        std::lock_guard<std::mutex> lock(mutex_);
        methods_.push_back(method);
    }

    int listCallCount() const { return listCallCount_; }

private:
    std::mutex mutex_;
    std::vector<domain::PaymentMethod> methods_;
    int listCallCount_ = 0;
};

} // namespace payment::adapters::secondary
