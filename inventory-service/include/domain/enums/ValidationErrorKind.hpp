#pragma once

#include <string>
#include <stdexcept>

namespace inventory::domain {

/**
 * @brief Категория ошибки валидации движения товара
 */
enum class ValidationErrorKind {
    QUANTITY_NOT_SET,       ///< Количество не задано
    NON_POSITIVE_QUANTITY,  ///< Количество <= 0
    RATE_NOT_SET,           ///< Ставка не задана
    NON_POSITIVE_RATE,      ///< Ставка <= 0
    NO_LOCATION,            ///< Не задан ни источник, ни получатель
    INSUFFICIENT_QUANTITY,  ///< Недостаточно остатка на дату движения
    FUTURE_NEGATIVE_STOCK   ///< Движение уводит будущие записи в минус
};

/**
 * @brief Преобразовать в строку
 */
inline std::string toString(ValidationErrorKind kind) {
    switch (kind) {
        case ValidationErrorKind::QUANTITY_NOT_SET:      return "QUANTITY_NOT_SET";
        case ValidationErrorKind::NON_POSITIVE_QUANTITY: return "NON_POSITIVE_QUANTITY";
        case ValidationErrorKind::RATE_NOT_SET:          return "RATE_NOT_SET";
        case ValidationErrorKind::NON_POSITIVE_RATE:     return "NON_POSITIVE_RATE";
        case ValidationErrorKind::NO_LOCATION:           return "NO_LOCATION";
        case ValidationErrorKind::INSUFFICIENT_QUANTITY: return "INSUFFICIENT_QUANTITY";
        case ValidationErrorKind::FUTURE_NEGATIVE_STOCK: return "FUTURE_NEGATIVE_STOCK";
    }
    return "UNKNOWN";
}

/**
 * @brief Создать из строки
 * @throws std::invalid_argument если строка не распознана
 */
inline ValidationErrorKind validationErrorKindFromString(const std::string& str) {
    if (str == "QUANTITY_NOT_SET")      return ValidationErrorKind::QUANTITY_NOT_SET;
    if (str == "NON_POSITIVE_QUANTITY") return ValidationErrorKind::NON_POSITIVE_QUANTITY;
    if (str == "RATE_NOT_SET")          return ValidationErrorKind::RATE_NOT_SET;
    if (str == "NON_POSITIVE_RATE")     return ValidationErrorKind::NON_POSITIVE_RATE;
    if (str == "NO_LOCATION")           return ValidationErrorKind::NO_LOCATION;
    if (str == "INSUFFICIENT_QUANTITY") return ValidationErrorKind::INSUFFICIENT_QUANTITY;
    if (str == "FUTURE_NEGATIVE_STOCK") return ValidationErrorKind::FUTURE_NEGATIVE_STOCK;
    throw std::invalid_argument("Unknown ValidationErrorKind: " + str);
}

/**
 * @brief Относится ли ошибка к проверке остатков (а не к форме запроса)
 */
inline bool isStockShortage(ValidationErrorKind kind) {
    return kind == ValidationErrorKind::INSUFFICIENT_QUANTITY ||
           kind == ValidationErrorKind::FUTURE_NEGATIVE_STOCK;
}

} // namespace inventory::domain
