#pragma once

#include "ports/output/IDelayer.hpp"
#include <vector>

namespace payment::tests {

/**
 * @brief IDelayer без сна: только запоминает запрошенные задержки
 */
class RecordingDelayer : public ports::output::IDelayer {
public:
    void delay(std::chrono::milliseconds duration) override {
        delays_.push_back(duration);
    }

    const std::vector<std::chrono::milliseconds>& getDelays() const { return delays_; }

private:
    std::vector<std::chrono::milliseconds> delays_;
};

} // namespace payment::tests
