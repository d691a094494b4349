#pragma once

#include <string>
#include <chrono>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <stdexcept>

namespace inventory::domain {

/**
 * @brief Временная метка (UTC, точность до секунды)
 *
 * Даты движения хранятся и сравниваются в UTC, поэтому парсинг
 * использует timegm, а не mktime.
 */
class Timestamp {
public:
    std::chrono::system_clock::time_point value;

    Timestamp() : value(std::chrono::system_clock::now()) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(tp) {}

    static Timestamp now() {
        return Timestamp(std::chrono::system_clock::now());
    }

    /**
     * @brief Разобрать ISO 8601
     *
     * Поддерживаются "2024-01-10", "2024-01-10T08:30:00",
     * "2024-01-10 08:30:00" и суффикс "Z".
     *
     * @throws std::invalid_argument если строка не распознана
     */
    static Timestamp fromString(const std::string& str) {
        std::tm tm = {};
        std::istringstream ss(str);

        if (str.size() > 10 && (str[10] == 'T' || str[10] == ' ')) {
            const char* format = str[10] == 'T' ? "%Y-%m-%dT%H:%M:%S" : "%Y-%m-%d %H:%M:%S";
            ss >> std::get_time(&tm, format);
        } else {
            ss >> std::get_time(&tm, "%Y-%m-%d");
        }

        if (ss.fail()) {
            throw std::invalid_argument("Invalid timestamp: " + str);
        }

        return Timestamp(std::chrono::system_clock::from_time_t(timegm(&tm)));
    }

    std::string toString() const {
        return format("%Y-%m-%dT%H:%M:%SZ");
    }

    /**
     * @brief Отформатировать по шаблону strftime (UTC)
     */
    std::string format(const std::string& pattern) const {
        auto time_t_val = std::chrono::system_clock::to_time_t(value);
        std::tm tm = {};
        gmtime_r(&time_t_val, &tm);

        std::ostringstream ss;
        ss << std::put_time(&tm, pattern.c_str());
        return ss.str();
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

    bool operator!=(const Timestamp& other) const {
        return value != other.value;
    }
};

} // namespace inventory::domain
