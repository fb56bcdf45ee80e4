#pragma once

#include <string>

namespace payment::ports::output {

/**
 * @brief Справочник покупателей (Auth Service)
 */
class ICustomerDirectory {
public:
    virtual ~ICustomerDirectory() = default;

    virtual bool exists(const std::string& customerId) = 0;
};

} // namespace payment::ports::output
