#pragma once

#include "domain/Timestamp.hpp"
#include <string>

namespace inventory::ports::output {

/**
 * @brief Форматирование дат для сообщений об ошибках
 */
class IDateFormatter {
public:
    virtual ~IDateFormatter() = default;

    virtual std::string format(const domain::Timestamp& date) const = 0;
};

} // namespace inventory::ports::output
