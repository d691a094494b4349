#pragma once

#include "ports/output/IStockLedgerRepository.hpp"
#include "ports/output/IStockBalanceQuery.hpp"
#include <mutex>
#include <vector>
#include <algorithm>
#include <iterator>
#include <iostream>

namespace inventory::adapters::secondary {

/**
 * @brief In-memory реализация журнала остатков
 *
 * Реализует оба порта (журнал и запрос остатков) над одним вектором
 * записей. Записи хранятся в порядке добавления.
 */
class InMemoryStockLedgerRepository
    : public ports::output::IStockLedgerRepository
    , public ports::output::IStockBalanceQuery
{
public:
    /**
     * @brief Добавить записи (под одной блокировкой)
     */
    void appendEntries(const std::vector<domain::StockLedgerEntry>& entries) override {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.insert(entries_.end(), entries.begin(), entries.end());
    }

    /**
     * @brief Удалить все записи документа
     */
    std::size_t deleteAllByReference(
        const std::string& referenceType,
        const std::string& referenceName
    ) override {
        std::lock_guard<std::mutex> lock(mutex_);

        auto before = entries_.size();
        entries_.erase(
            std::remove_if(entries_.begin(), entries_.end(),
                [&](const domain::StockLedgerEntry& e) {
                    return e.belongsTo(referenceType, referenceName);
                }),
            entries_.end());

        auto removed = before - entries_.size();
        std::cout << "[InMemoryLedger] Deleted " << removed << " entries of "
                  << referenceType << "/" << referenceName << std::endl;
        return removed;
    }

    /**
     * @brief Сумма количеств строго до / строго после даты
     */
    std::optional<double> getStockQuantity(
        const std::string& item,
        const std::string& location,
        const std::optional<std::string>& batch,
        domain::BalanceDirection direction,
        const domain::Timestamp& date
    ) override {
        std::lock_guard<std::mutex> lock(mutex_);

        bool found = false;
        double sum = 0.0;

        for (const auto& e : entries_) {
            if (e.item != item || e.location != location) {
                continue;
            }
            if (batch && e.batch != batch) {
                continue;
            }

            bool inWindow = direction == domain::BalanceDirection::BEFORE
                ? e.date < date
                : e.date > date;
            if (!inWindow) {
                continue;
            }

            found = true;
            sum += e.quantity;
        }

        return found ? std::optional<double>(sum) : std::nullopt;
    }

    /**
     * @brief Найти записи документа в порядке добавления
     */
    std::vector<domain::StockLedgerEntry> findByReference(
        const std::string& referenceType,
        const std::string& referenceName
    ) const {
        std::lock_guard<std::mutex> lock(mutex_);

        std::vector<domain::StockLedgerEntry> result;
        std::copy_if(entries_.begin(), entries_.end(), std::back_inserter(result),
            [&](const domain::StockLedgerEntry& e) {
                return e.belongsTo(referenceType, referenceName);
            });
        return result;
    }

    /**
     * @brief Все записи в порядке добавления
     */
    std::vector<domain::StockLedgerEntry> getAll() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_;
    }

    size_t count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::vector<domain::StockLedgerEntry> entries_;
};

} // namespace inventory::adapters::secondary
