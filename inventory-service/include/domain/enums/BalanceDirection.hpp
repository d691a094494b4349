#pragma once

#include <string>

namespace inventory::domain {

/**
 * @brief С какой стороны от даты суммируются записи журнала
 */
enum class BalanceDirection {
    BEFORE,  ///< Записи строго до даты
    AFTER    ///< Записи строго после даты
};

inline std::string toString(BalanceDirection direction) {
    return direction == BalanceDirection::BEFORE ? "BEFORE" : "AFTER";
}

} // namespace inventory::domain
