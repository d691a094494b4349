#pragma once

#include "Money.hpp"
#include "Timestamp.hpp"
#include "TransferReference.hpp"
#include <string>
#include <optional>

namespace inventory::domain {

/**
 * @brief Запрос на перемещение товара
 *
 * Одна строка документа движения: переместить quantity единиц item
 * из fromLocation в toLocation. Отсутствие fromLocation означает
 * приход, отсутствие toLocation - расход.
 */
struct TransferRequest {
    std::string item;                          ///< Код товара
    std::optional<Money> rate;                 ///< Ставка за единицу
    std::optional<double> quantity;            ///< Количество (> 0)
    Timestamp date;                            ///< Дата движения
    std::optional<std::string> fromLocation;   ///< Склад-источник
    std::optional<std::string> toLocation;     ///< Склад-получатель
    std::optional<std::string> batch;          ///< Партия
    std::string referenceType;                 ///< Тип документа-владельца
    std::string referenceName;                 ///< Идентификатор документа-владельца

    TransferRequest() = default;

    TransferRequest(
        const std::string& item,
        double quantity,
        const Money& rate,
        const Timestamp& date,
        std::optional<std::string> fromLocation,
        std::optional<std::string> toLocation,
        std::optional<std::string> batch = std::nullopt
    ) : item(item), rate(rate), quantity(quantity), date(date),
        fromLocation(std::move(fromLocation)), toLocation(std::move(toLocation)),
        batch(std::move(batch)) {}

    /**
     * @brief Обратное движение: источник и получатель меняются местами
     */
    TransferRequest reversed() const {
        TransferRequest reverse = *this;
        reverse.fromLocation = toLocation;
        reverse.toLocation = fromLocation;
        return reverse;
    }

    /**
     * @brief Копия запроса со ссылкой на документ
     */
    TransferRequest withReference(const TransferReference& reference) const {
        TransferRequest stamped = *this;
        stamped.referenceType = reference.type;
        stamped.referenceName = reference.name;
        return stamped;
    }
};

} // namespace inventory::domain
