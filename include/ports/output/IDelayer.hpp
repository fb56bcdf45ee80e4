#pragma once

#include <chrono>

namespace payment::ports::output {

/**
 * @brief Пауза между повторами (подменяется в тестах)
 */
class IDelayer {
public:
    virtual ~IDelayer() = default;

    virtual void delay(std::chrono::milliseconds duration) = 0;
};

} // namespace payment::ports::output
