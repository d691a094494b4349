#pragma once

#include "ports/input/IStockTransferService.hpp"
#include "ports/output/IStockBalanceQuery.hpp"
#include "ports/output/IStockLedgerRepository.hpp"
#include "ports/output/IDateFormatter.hpp"
#include "application/StockTransferItem.hpp"
#include "domain/TransferReference.hpp"
#include "domain/TransferRequest.hpp"
#include <memory>
#include <vector>

namespace inventory::application {

/**
 * @brief Сервис перемещения товаров по одному документу
 *
 * Управляет группой StockTransferItem одного документа
 * (например, одного Stock Movement).
 *
 * Архитектура:
 * - validateTransfers → проверка каждой строки, без записи
 * - createTransfers → повторная проверка всех строк, затем
 *   StockTransferItem на строку и запись в журнал
 * - cancelTransfers → удаление всех записей документа
 * - validateCancel → проверка обратных движений
 *
 * Проверка строки (первое нарушение прерывает пакет):
 * 1. quantity задано и > 0
 * 2. rate задана и > 0
 * 3. задан хотя бы один склад
 * 4. при расходе: остаток до даты >= quantity, и уже записанные
 *    будущие движения не уходят в минус
 *
 * Записи, добавленные до сбоя журнала внутри createTransfers, остаются:
 * откат между StockTransferItem не выполняется.
 */
class StockTransferService : public ports::input::IStockTransferService {
public:
    StockTransferService(
        const domain::TransferReference& reference,
        bool isCancelled,
        std::shared_ptr<ports::output::IStockBalanceQuery> balanceQuery,
        std::shared_ptr<ports::output::IStockLedgerRepository> ledger,
        std::shared_ptr<ports::output::IDateFormatter> formatter);

    void validateTransfers(const std::vector<domain::TransferRequest>& requests) override;

    std::vector<domain::StockLedgerEntry> createTransfers(
        const std::vector<domain::TransferRequest>& requests) override;

    std::size_t cancelTransfers() override;

    void validateCancel(const std::vector<domain::TransferRequest>& requests) override;

    const domain::TransferReference& reference() const { return reference_; }

    bool isCancelled() const { return isCancelled_; }

    const std::vector<StockTransferItem>& items() const { return items_; }

private:
    domain::TransferReference reference_;
    bool isCancelled_;
    std::shared_ptr<ports::output::IStockBalanceQuery> balanceQuery_;
    std::shared_ptr<ports::output::IStockLedgerRepository> ledger_;
    std::shared_ptr<ports::output::IDateFormatter> formatter_;
    std::vector<StockTransferItem> items_;

    std::vector<domain::TransferRequest> stamp(
        const std::vector<domain::TransferRequest>& requests) const;

    void createTransfer(const domain::TransferRequest& request);
    std::vector<domain::StockLedgerEntry> sync();

    void validate(const domain::TransferRequest& request);
    void validateQuantity(const domain::TransferRequest& request) const;
    void validateRate(const domain::TransferRequest& request) const;
    void validateLocation(const domain::TransferRequest& request) const;
    void validateStockAvailability(const domain::TransferRequest& request);
};

} // namespace inventory::application
