#include "application/StockTransferItem.hpp"
#include <algorithm>
#include <iterator>
#include <iostream>

namespace inventory::application {

StockTransferItem::StockTransferItem(
    const domain::TransferRequest& request,
    std::shared_ptr<ports::output::IStockLedgerRepository> ledger
) : request_(request)
  , ledger_(std::move(ledger))
{}

void StockTransferItem::transferStock() {
    clear();

    if (request_.fromLocation) {
        moveStockForSingleLocation(*request_.fromLocation, true);
    }

    if (request_.toLocation) {
        moveStockForSingleLocation(*request_.toLocation, false);
    }
}

void StockTransferItem::sync() {
    auto ordered = orderedEntries();
    if (ordered.empty()) {
        return;
    }

    ledger_->appendEntries(ordered);
    std::cout << "[StockTransferItem] Synced " << ordered.size()
              << " entries for item " << request_.item << std::endl;
}

std::vector<domain::StockLedgerEntry> StockTransferItem::orderedEntries() const {
    std::vector<domain::StockLedgerEntry> ordered;
    ordered.reserve(entries_.size());

    std::copy_if(entries_.begin(), entries_.end(), std::back_inserter(ordered),
        [](const domain::StockLedgerEntry& e) { return e.quantity <= 0; });
    std::copy_if(entries_.begin(), entries_.end(), std::back_inserter(ordered),
        [](const domain::StockLedgerEntry& e) { return e.quantity > 0; });

    return ordered;
}

void StockTransferItem::moveStockForSingleLocation(const std::string& location, bool isOutward) {
    double quantity = request_.quantity.value_or(0.0);
    if (quantity == 0) {
        return;
    }

    if (isOutward) {
        quantity = -quantity;
    }

    entries_.emplace_back(
        request_.item,
        location,
        request_.batch,
        quantity,
        request_.rate.value_or(domain::Money()),
        request_.date,
        request_.referenceType,
        request_.referenceName
    );
}

void StockTransferItem::clear() {
    entries_.clear();
}

} // namespace inventory::application
