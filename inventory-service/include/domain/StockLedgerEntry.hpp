// include/domain/StockLedgerEntry.hpp
#pragma once

#include "Money.hpp"
#include "Timestamp.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <optional>

namespace inventory::domain {

/**
 * @brief Запись журнала остатков
 *
 * Неизменяемый факт движения: отрицательное quantity - расход со склада,
 * положительное - приход. Остаток по item + location (+ batch) на дату
 * равен сумме quantity всех записей до этой даты.
 *
 * Записи никогда не изменяются; отмена документа удаляет все его записи
 * по referenceType + referenceName.
 */
struct StockLedgerEntry {
    std::string item;                   ///< Код товара
    std::string location;               ///< Склад
    std::optional<std::string> batch;   ///< Партия
    double quantity = 0.0;              ///< Количество со знаком
    Money rate;                         ///< Ставка за единицу
    Timestamp date;                     ///< Дата движения
    std::string referenceType;          ///< Тип документа-владельца
    std::string referenceName;          ///< Идентификатор документа-владельца

    StockLedgerEntry() = default;

    StockLedgerEntry(
        const std::string& item,
        const std::string& location,
        std::optional<std::string> batch,
        double quantity,
        const Money& rate,
        const Timestamp& date,
        const std::string& referenceType,
        const std::string& referenceName
    ) : item(item), location(location), batch(std::move(batch)),
        quantity(quantity), rate(rate), date(date),
        referenceType(referenceType), referenceName(referenceName) {}

    bool isOutward() const { return quantity <= 0; }

    bool belongsTo(const std::string& type, const std::string& name) const {
        return referenceType == type && referenceName == name;
    }

    nlohmann::json toJson() const;
};

} // namespace inventory::domain
