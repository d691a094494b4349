#pragma once

#include "domain/Timestamp.hpp"
#include "domain/enums/BalanceDirection.hpp"
#include <string>
#include <optional>

namespace inventory::ports::output {

/**
 * @brief Интерфейс запроса остатков по журналу
 *
 * Output Port. Суммирует quantity записей журнала для item + location
 * (и batch, если задана) по одну сторону от даты:
 * - BEFORE: записи строго до date;
 * - AFTER: записи строго после date.
 *
 * Возвращает std::nullopt, если подходящих записей нет. Отсутствие
 * записей и нулевая сумма - разные ответы.
 *
 * Ошибки хранилища пробрасываются исключениями.
 */
class IStockBalanceQuery {
public:
    virtual ~IStockBalanceQuery() = default;

    /**
     * @brief Сумма количеств по одну сторону от даты
     *
     * @param item Код товара
     * @param location Склад
     * @param batch Партия (без фильтра, если не задана)
     * @param direction BEFORE или AFTER
     * @param date Граница (не включается)
     */
    virtual std::optional<double> getStockQuantity(
        const std::string& item,
        const std::string& location,
        const std::optional<std::string>& batch,
        domain::BalanceDirection direction,
        const domain::Timestamp& date
    ) = 0;
};

} // namespace inventory::ports::output
