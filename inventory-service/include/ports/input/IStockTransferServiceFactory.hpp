#pragma once

#include "IStockTransferService.hpp"
#include "domain/TransferReference.hpp"
#include <memory>

namespace inventory::ports::input {

/**
 * @brief Фабрика сервисов перемещения
 *
 * Сервис живёт один вызов и привязан к документу, поэтому
 * адаптеры получают фабрику, а не сам сервис.
 */
class IStockTransferServiceFactory {
public:
    virtual ~IStockTransferServiceFactory() = default;

    /**
     * @param reference Документ-владелец движений
     * @param isCancelled Обработка обратного движения уже отменённого документа
     */
    virtual std::unique_ptr<IStockTransferService> create(
        const domain::TransferReference& reference,
        bool isCancelled) = 0;
};

} // namespace inventory::ports::input
