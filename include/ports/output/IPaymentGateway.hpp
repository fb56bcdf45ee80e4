#pragma once

#include "domain/GatewayRequest.hpp"

namespace payment::ports::output {

/**
 * @brief Внешний платёжный шлюз (карта, терминал)
 *
 * Отказ шлюза возвращается как approved=false.
 * Сбой транспорта бросает domain::GatewayTransportError.
 */
class IPaymentGateway {
public:
    virtual ~IPaymentGateway() = default;

    virtual domain::GatewayResponse charge(const domain::GatewayRequest& request) = 0;
};

} // namespace payment::ports::output
