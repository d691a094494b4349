#pragma once

#include "ports/output/IStockLedgerRepository.hpp"
#include <vector>
#include <string>
#include <utility>
#include <stdexcept>

namespace inventory::tests {

/**
 * @brief Mock реализация IStockLedgerRepository для тестов
 *
 * Запоминает каждый вызов appendEntries отдельным пакетом.
 * failOnAppend(n) - n-й вызов appendEntries (с 1) бросает исключение.
 */
class MockStockLedgerRepository : public ports::output::IStockLedgerRepository {
public:
    struct DeleteCall {
        std::string referenceType;
        std::string referenceName;
    };

    // Получение записанных данных
    const std::vector<std::vector<domain::StockLedgerEntry>>& getAppendedBatches() const {
        return batches_;
    }

    std::vector<domain::StockLedgerEntry> getAllEntries() const {
        std::vector<domain::StockLedgerEntry> all;
        for (const auto& batch : batches_) {
            all.insert(all.end(), batch.begin(), batch.end());
        }
        return all;
    }

    const std::vector<DeleteCall>& getDeleteCalls() const { return deletes_; }

    int appendCallCount() const { return appendCalls_; }

    void failOnAppend(int callNumber) { failOnAppend_ = callNumber; }

    void setDeleteResult(std::size_t removed) { deleteResult_ = removed; }

    // IStockLedgerRepository implementation
    void appendEntries(const std::vector<domain::StockLedgerEntry>& entries) override {
        ++appendCalls_;
        if (appendCalls_ == failOnAppend_) {
            throw std::runtime_error("ledger unavailable");
        }
        batches_.push_back(entries);
    }

    std::size_t deleteAllByReference(
        const std::string& referenceType,
        const std::string& referenceName
    ) override {
        deletes_.push_back({referenceType, referenceName});
        return deleteResult_;
    }

private:
    std::vector<std::vector<domain::StockLedgerEntry>> batches_;
    std::vector<DeleteCall> deletes_;
    int appendCalls_ = 0;
    int failOnAppend_ = 0;
    std::size_t deleteResult_ = 0;
};

} // namespace inventory::tests
