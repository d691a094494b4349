#pragma once

#include <string>
#include <cstdint>
#include <cmath>
#include <stdexcept>

namespace inventory::domain {

/**
 * @brief Денежное значение с валютой (ставка / себестоимость единицы)
 *
 * Хранит целую часть и дробную часть в нано-единицах (10^-9) для точности.
 */
class Money {
public:
    int64_t units = 0;      // Целая часть
    int32_t nano = 0;       // Дробная часть (10^-9)
    std::string currency = "USD";

    Money() = default;

    Money(int64_t u, int32_t n, const std::string& cur = "USD")
        : units(u), nano(n), currency(cur) {}

    /**
     * @throws std::invalid_argument если value не конечно или не помещается в int64
     */
    static Money fromDouble(double value, const std::string& cur = "USD") {
        // 2^63: первое значение за пределами int64
        constexpr double limit = 9223372036854775808.0;
        if (!std::isfinite(value) || value >= limit || value <= -limit) {
            throw std::invalid_argument("Money value out of range: " + std::to_string(value));
        }

        Money m;
        m.currency = cur;
        m.units = static_cast<int64_t>(value);
        m.nano = static_cast<int32_t>(std::llround((value - m.units) * 1e9));

        // Нормализация после округления
        if (m.nano >= 1000000000) {
            m.units++;
            m.nano -= 1000000000;
        } else if (m.nano <= -1000000000) {
            m.units--;
            m.nano += 1000000000;
        }
        return m;
    }

    double toDouble() const {
        return static_cast<double>(units) + static_cast<double>(nano) / 1e9;
    }

    bool isZero() const {
        return units == 0 && nano == 0;
    }

    /**
     * @brief Строго больше нуля
     */
    bool isPositive() const {
        return units > 0 || (units == 0 && nano > 0);
    }

    bool operator==(const Money& other) const {
        return units == other.units && nano == other.nano && currency == other.currency;
    }

    bool operator!=(const Money& other) const {
        return !(*this == other);
    }
};

} // namespace inventory::domain
