#pragma once

#include "ports/output/IDelayer.hpp"
#include <thread>

namespace payment::adapters::secondary {

/**
 * @brief Задержка через sleep_for (блокирует только поток текущего запроса)
 */
class ThreadDelayer : public ports::output::IDelayer {
public:
    void delay(std::chrono::milliseconds duration) override {
        std::this_thread::sleep_for(duration);
    }
};

} // namespace payment::adapters::secondary
