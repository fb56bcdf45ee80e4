#pragma once

#include <string>
#include <chrono>
#include <sstream>
#include <iomanip>
#include <ctime>

namespace payment::domain {

/**
 * @brief Временная метка (UTC, точность до секунды при сериализации)
 */
class Timestamp {
public:
    std::chrono::system_clock::time_point value;

    Timestamp() : value(std::chrono::system_clock::now()) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(tp) {}

    static Timestamp now() {
        return Timestamp(std::chrono::system_clock::now());
    }

    static Timestamp fromTimeT(std::time_t t) {
        return Timestamp(std::chrono::system_clock::from_time_t(t));
    }

    /**
     * @brief Разбор ISO 8601 ("2025-01-31T12:00:00Z") и формата БД ("2025-01-31 12:00:00")
     */
    static Timestamp fromString(const std::string& str) {
        std::tm tm = {};
        std::istringstream ss(str);
        if (str.find('T') != std::string::npos) {
            ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        } else {
            ss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
        }
        return fromTimeT(timegm(&tm));
    }

    std::string toString() const {
        return format("%Y-%m-%dT%H:%M:%SZ");
    }

    /**
     * @brief Формат для документов и БД: "2025-01-31 12:00:00"
     */
    std::string toDisplayString() const {
        return format("%Y-%m-%d %H:%M:%S");
    }

    Timestamp plusDays(int days) const {
        return Timestamp(value + std::chrono::hours(24 * days));
    }

    /**
     * @brief Отбросить доли секунды (для детерминированной сериализации)
     */
    Timestamp truncatedToSeconds() const {
        return Timestamp(std::chrono::time_point_cast<std::chrono::seconds>(value));
    }

    bool operator<(const Timestamp& other) const {
        return value < other.value;
    }

    bool operator>(const Timestamp& other) const {
        return value > other.value;
    }

    bool operator==(const Timestamp& other) const {
        return value == other.value;
    }

private:
    std::string format(const char* pattern) const {
        auto time_t_val = std::chrono::system_clock::to_time_t(value);
        std::tm tm = {};
        gmtime_r(&time_t_val, &tm);

        std::ostringstream ss;
        ss << std::put_time(&tm, pattern);
        return ss.str();
    }
};

} // namespace payment::domain
