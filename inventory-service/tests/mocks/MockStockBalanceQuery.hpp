#pragma once

#include <gmock/gmock.h>

#include "ports/output/IStockBalanceQuery.hpp"
#include "ports/output/IDateFormatter.hpp"

namespace inventory::tests {

class MockStockBalanceQuery : public ports::output::IStockBalanceQuery {
public:
    MOCK_METHOD(std::optional<double>, getStockQuantity,
                (const std::string& item,
                 const std::string& location,
                 const std::optional<std::string>& batch,
                 domain::BalanceDirection direction,
                 const domain::Timestamp& date),
                (override));
};

/**
 * @brief Форматтер с предсказуемым выводом (только дата)
 */
class FixedDateFormatter : public ports::output::IDateFormatter {
public:
    std::string format(const domain::Timestamp& date) const override {
        return date.format("%Y-%m-%d");
    }
};

} // namespace inventory::tests
