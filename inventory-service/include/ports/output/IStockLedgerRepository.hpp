#pragma once

#include "domain/StockLedgerEntry.hpp"
#include <string>
#include <vector>
#include <cstddef>

namespace inventory::ports::output {

/**
 * @brief Интерфейс журнала остатков
 *
 * Output Port для записи и удаления записей журнала.
 * Журнал только дополняется; исправление - это удаление всех
 * записей документа и новая запись.
 */
class IStockLedgerRepository {
public:
    virtual ~IStockLedgerRepository() = default;

    /**
     * @brief Добавить записи в указанном порядке
     *
     * @param entries Записи журнала
     */
    virtual void appendEntries(const std::vector<domain::StockLedgerEntry>& entries) = 0;

    /**
     * @brief Удалить все записи документа
     *
     * @param referenceType Тип документа
     * @param referenceName Идентификатор документа
     * @return Количество удалённых записей
     */
    virtual std::size_t deleteAllByReference(
        const std::string& referenceType,
        const std::string& referenceName
    ) = 0;
};

} // namespace inventory::ports::output
