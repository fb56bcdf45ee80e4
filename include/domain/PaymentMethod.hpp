#pragma once

#include <string>

namespace payment::domain {

/**
 * @brief Метод оплаты из справочника
 */
class PaymentMethod {
public:
    std::string code;
    std::string title;
    std::string description;
    std::string imageUrl;
    bool isActive = true;
    int displayOrder = 0;

    PaymentMethod() = default;

    PaymentMethod(const std::string& code_, const std::string& title_,
                  const std::string& description_, const std::string& imageUrl_,
                  bool active, int order)
        : code(code_)
        , title(title_)
        , description(description_)
        , imageUrl(imageUrl_)
        , isActive(active)
        , displayOrder(order)
    {}
};

} // namespace payment::domain
