#pragma once

#include "domain/TransferRequest.hpp"
#include "domain/StockLedgerEntry.hpp"
#include <vector>
#include <cstddef>

namespace inventory::ports::input {

/**
 * @brief Интерфейс сервиса перемещения товаров
 *
 * Экземпляр обслуживает один документ (одну ссылку referenceType +
 * referenceName). Ошибки валидации - domain::StockValidationError.
 */
class IStockTransferService {
public:
    virtual ~IStockTransferService() = default;

    /**
     * @brief Проверить пакет движений, ничего не записывая
     */
    virtual void validateTransfers(const std::vector<domain::TransferRequest>& requests) = 0;

    /**
     * @brief Проверить и записать пакет движений
     * @return Записанные записи журнала в порядке записи
     */
    virtual std::vector<domain::StockLedgerEntry> createTransfers(
        const std::vector<domain::TransferRequest>& requests) = 0;

    /**
     * @brief Удалить все записи журнала документа
     * @return Количество удалённых записей
     */
    virtual std::size_t cancelTransfers() = 0;

    /**
     * @brief Проверить, что обратное движение допустимо
     */
    virtual void validateCancel(const std::vector<domain::TransferRequest>& requests) = 0;
};

} // namespace inventory::ports::input
