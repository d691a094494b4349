#pragma once

#include "ports/input/IStockTransferServiceFactory.hpp"
#include "application/StockTransferService.hpp"
#include <memory>
#include <iostream>

namespace inventory::application {

/**
 * @brief Создаёт StockTransferService с общими адаптерами
 */
class StockTransferServiceFactory : public ports::input::IStockTransferServiceFactory {
public:
    StockTransferServiceFactory(
        std::shared_ptr<ports::output::IStockBalanceQuery> balanceQuery,
        std::shared_ptr<ports::output::IStockLedgerRepository> ledger,
        std::shared_ptr<ports::output::IDateFormatter> formatter
    ) : balanceQuery_(std::move(balanceQuery))
      , ledger_(std::move(ledger))
      , formatter_(std::move(formatter))
    {
        std::cout << "[StockTransferServiceFactory] Created" << std::endl;
    }

    std::unique_ptr<ports::input::IStockTransferService> create(
        const domain::TransferReference& reference,
        bool isCancelled) override
    {
        return std::make_unique<StockTransferService>(
            reference, isCancelled, balanceQuery_, ledger_, formatter_);
    }

private:
    std::shared_ptr<ports::output::IStockBalanceQuery> balanceQuery_;
    std::shared_ptr<ports::output::IStockLedgerRepository> ledger_;
    std::shared_ptr<ports::output::IDateFormatter> formatter_;
};

} // namespace inventory::application
