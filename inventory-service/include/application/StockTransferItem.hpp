#pragma once

#include "ports/output/IStockLedgerRepository.hpp"
#include "domain/TransferRequest.hpp"
#include "domain/StockLedgerEntry.hpp"
#include <memory>
#include <vector>
#include <string>

namespace inventory::application {

/**
 * @brief Перемещение по одной строке документа
 *
 * Превращает проверенный TransferRequest в записи журнала:
 * - fromLocation → запись с -quantity (расход);
 * - toLocation → запись с +quantity (приход).
 *
 * Перемещение между складами даёт две записи, чистый приход
 * или расход - одну.
 */
class StockTransferItem {
public:
    StockTransferItem(
        const domain::TransferRequest& request,
        std::shared_ptr<ports::output::IStockLedgerRepository> ledger);

    /**
     * @brief Сформировать записи журнала (предыдущие сбрасываются)
     */
    void transferStock();

    /**
     * @brief Записать сформированные записи в журнал
     *
     * Сначала все записи расхода (quantity <= 0), затем прихода,
     * каждая группа в порядке создания. Одним вызовом appendEntries.
     */
    void sync();

    const std::vector<domain::StockLedgerEntry>& entries() const { return entries_; }

    /**
     * @brief Записи в порядке записи в журнал
     */
    std::vector<domain::StockLedgerEntry> orderedEntries() const;

private:
    domain::TransferRequest request_;
    std::shared_ptr<ports::output::IStockLedgerRepository> ledger_;
    std::vector<domain::StockLedgerEntry> entries_;

    void moveStockForSingleLocation(const std::string& location, bool isOutward);
    void clear();
};

} // namespace inventory::application
