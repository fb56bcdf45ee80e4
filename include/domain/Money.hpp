#pragma once

#include <string>
#include <cstdint>
#include <cmath>
#include <cstdlib>
#include <sstream>
#include <iomanip>

namespace payment::domain {

/**
 * @brief Денежное значение с валютой
 *
 * Хранит значение как целую часть + нано-доли (10^-9), чтобы сумма
 * по корзине считалась без накопления ошибок double.
 */
class Money {
public:
    static constexpr int64_t NANO_PER_UNIT = 1000000000;

    int64_t units = 0;      // Целая часть
    int32_t nano = 0;       // Дробная часть (10^-9)
    std::string currency = "USD";

    Money() = default;

    Money(int64_t u, int32_t n, const std::string& cur = "USD")
        : units(u), nano(n), currency(cur) {}

    static Money fromDouble(double value, const std::string& cur = "USD") {
        return fromNanos(static_cast<int64_t>(std::llround(value * NANO_PER_UNIT)), cur);
    }

    static Money fromNanos(int64_t totalNanos, const std::string& cur = "USD") {
        Money m;
        m.currency = cur;
        m.units = totalNanos / NANO_PER_UNIT;
        m.nano = static_cast<int32_t>(totalNanos % NANO_PER_UNIT);
        return m;
    }

    static Money zero(const std::string& cur = "USD") {
        return Money(0, 0, cur);
    }

    int64_t toNanos() const {
        return units * NANO_PER_UNIT + nano;
    }

    double toDouble() const {
        return static_cast<double>(units) + static_cast<double>(nano) / 1e9;
    }

    bool isZero() const {
        return units == 0 && nano == 0;
    }

    /**
     * @brief Сумма с двумя знаками после запятой ("30.00")
     */
    std::string toString() const {
        int64_t cents = toNanos() / 10000000;
        // Округление по третьему знаку
        int64_t rest = toNanos() % 10000000;
        if (rest >= 5000000) {
            ++cents;
        } else if (rest <= -5000000) {
            --cents;
        }

        std::ostringstream ss;
        if (cents < 0) {
            ss << "-";
        }
        ss << std::llabs(cents) / 100 << "."
           << std::setw(2) << std::setfill('0') << std::llabs(cents) % 100;
        return ss.str();
    }

    Money operator+(const Money& other) const {
        return fromNanos(toNanos() + other.toNanos(), currency);
    }

    Money operator-(const Money& other) const {
        return fromNanos(toNanos() - other.toNanos(), currency);
    }

    Money operator*(int64_t multiplier) const {
        return fromNanos(toNanos() * multiplier, currency);
    }

    /**
     * @brief Применить скидку в процентах (0-100)
     */
    Money discounted(int percent) const {
        return fromNanos(toNanos() * (100 - percent) / 100, currency);
    }

    bool operator<(const Money& other) const {
        return toNanos() < other.toNanos();
    }

    bool operator>(const Money& other) const {
        return toNanos() > other.toNanos();
    }

    bool operator==(const Money& other) const {
        return units == other.units && nano == other.nano && currency == other.currency;
    }

    bool operator!=(const Money& other) const {
        return !(*this == other);
    }
};

} // namespace payment::domain
