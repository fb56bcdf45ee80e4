#pragma once

#include <string>
#include <random>
#include <mutex>
#include <sstream>
#include <iomanip>
#include <cstdint>

namespace payment::adapters::secondary {

/**
 * @brief Генератор идентификаторов вида "<prefix>-<16 hex>"
 */
class IdGenerator {
public:
    IdGenerator() : rng_(std::random_device{}()) {}

    std::string next(const std::string& prefix) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::uniform_int_distribution<uint64_t> dist(0, UINT64_MAX);
        uint64_t id = dist(rng_);

        std::stringstream ss;
        ss << prefix << "-" << std::hex << std::setfill('0') << std::setw(16) << id;
        return ss.str();
    }

private:
    std::mt19937_64 rng_;
    std::mutex mutex_;
};

} // namespace payment::adapters::secondary
