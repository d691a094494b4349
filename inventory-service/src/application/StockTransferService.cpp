#include "application/StockTransferService.hpp"
#include "domain/StockValidationError.hpp"
#include <iostream>

namespace inventory::application {

StockTransferService::StockTransferService(
    const domain::TransferReference& reference,
    bool isCancelled,
    std::shared_ptr<ports::output::IStockBalanceQuery> balanceQuery,
    std::shared_ptr<ports::output::IStockLedgerRepository> ledger,
    std::shared_ptr<ports::output::IDateFormatter> formatter
) : reference_(reference)
  , isCancelled_(isCancelled)
  , balanceQuery_(std::move(balanceQuery))
  , ledger_(std::move(ledger))
  , formatter_(std::move(formatter))
{}

// ============================================================================
// ОПЕРАЦИИ ПАКЕТА
// ============================================================================

void StockTransferService::validateTransfers(const std::vector<domain::TransferRequest>& requests) {
    for (const auto& request : stamp(requests)) {
        validate(request);
    }
}

std::vector<domain::StockLedgerEntry> StockTransferService::createTransfers(
    const std::vector<domain::TransferRequest>& requests)
{
    auto stamped = stamp(requests);

    // Вся проверка до первой записи в журнал
    for (const auto& request : stamped) {
        validate(request);
    }

    items_.clear();
    for (const auto& request : stamped) {
        createTransfer(request);
    }

    auto persisted = sync();
    std::cout << "[StockTransferService] Created " << persisted.size()
              << " ledger entries for " << reference_.toString() << std::endl;
    return persisted;
}

std::size_t StockTransferService::cancelTransfers() {
    auto removed = ledger_->deleteAllByReference(reference_.type, reference_.name);
    std::cout << "[StockTransferService] Cancelled " << reference_.toString()
              << ", removed " << removed << " ledger entries" << std::endl;
    return removed;
}

void StockTransferService::validateCancel(const std::vector<domain::TransferRequest>& requests) {
    std::vector<domain::TransferRequest> reversed;
    reversed.reserve(requests.size());
    for (const auto& request : requests) {
        reversed.push_back(request.reversed());
    }

    validateTransfers(reversed);
}

// ============================================================================
// СОЗДАНИЕ И ЗАПИСЬ
// ============================================================================

std::vector<domain::TransferRequest> StockTransferService::stamp(
    const std::vector<domain::TransferRequest>& requests) const
{
    std::vector<domain::TransferRequest> stamped;
    stamped.reserve(requests.size());
    for (const auto& request : requests) {
        stamped.push_back(request.withReference(reference_));
    }
    return stamped;
}

void StockTransferService::createTransfer(const domain::TransferRequest& request) {
    StockTransferItem item(request, ledger_);
    item.transferStock();
    items_.push_back(std::move(item));
}

std::vector<domain::StockLedgerEntry> StockTransferService::sync() {
    std::vector<domain::StockLedgerEntry> persisted;
    for (auto& item : items_) {
        item.sync();
        auto ordered = item.orderedEntries();
        persisted.insert(persisted.end(), ordered.begin(), ordered.end());
    }
    return persisted;
}

// ============================================================================
// ПРОВЕРКИ
// ============================================================================

void StockTransferService::validate(const domain::TransferRequest& request) {
    try {
        validateQuantity(request);
        validateRate(request);
        validateLocation(request);
        validateStockAvailability(request);
    } catch (const domain::StockValidationError& e) {
        std::cout << "[StockTransferService] REJECTED " << reference_.toString()
                  << " (" << domain::toString(e.kind()) << "): item " << request.item << std::endl;
        throw;
    }
}

void StockTransferService::validateQuantity(const domain::TransferRequest& request) const {
    if (!request.quantity) {
        throw domain::StockValidationError::quantityNotSet();
    }

    // NaN не проходит сравнение и тоже отклоняется
    if (!(*request.quantity > 0)) {
        throw domain::StockValidationError::nonPositiveQuantity(*request.quantity);
    }
}

void StockTransferService::validateRate(const domain::TransferRequest& request) const {
    if (!request.rate) {
        throw domain::StockValidationError::rateNotSet();
    }

    if (!request.rate->isPositive()) {
        throw domain::StockValidationError::nonPositiveRate(request.rate->toDouble());
    }
}

void StockTransferService::validateLocation(const domain::TransferRequest& request) const {
    if (request.fromLocation) {
        return;
    }

    if (request.toLocation) {
        return;
    }

    throw domain::StockValidationError::noLocation();
}

void StockTransferService::validateStockAvailability(const domain::TransferRequest& request) {
    if (!request.fromLocation) {
        return;
    }

    const std::string& location = *request.fromLocation;
    const double quantity = *request.quantity;

    double quantityBefore = balanceQuery_->getStockQuantity(
        request.item, location, request.batch,
        domain::BalanceDirection::BEFORE, request.date
    ).value_or(0.0);

    // Прямая запись отменяемого документа ещё в журнале
    if (isCancelled_) {
        quantityBefore += quantity;
    }

    if (quantityBefore < quantity) {
        throw domain::StockValidationError::insufficientQuantity(
            quantity - quantityBefore,
            request.item, location, request.batch,
            formatter_->format(request.date));
    }

    auto quantityAfter = balanceQuery_->getStockQuantity(
        request.item, location, request.batch,
        domain::BalanceDirection::AFTER, request.date);

    // Будущих движений нет
    if (!quantityAfter) {
        return;
    }

    double quantityRemaining = quantityBefore - quantity;
    if (*quantityAfter < quantityRemaining) {
        throw domain::StockValidationError::futureNegativeStock(
            *quantityAfter - quantityRemaining,
            request.item, location, request.batch,
            formatter_->format(request.date));
    }
}

} // namespace inventory::application
