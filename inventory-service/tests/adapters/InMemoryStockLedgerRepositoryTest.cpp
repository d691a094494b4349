/**
 * @file InMemoryStockLedgerRepositoryTest.cpp
 * @brief Unit tests for InMemoryStockLedgerRepository
 */

#include <gtest/gtest.h>
#include "adapters/secondary/persistence/InMemoryStockLedgerRepository.hpp"

using namespace inventory;
using namespace inventory::adapters::secondary;
using domain::BalanceDirection;
using domain::Timestamp;

class InMemoryStockLedgerRepositoryTest : public ::testing::Test {
protected:
    domain::StockLedgerEntry entry(
        const std::string& location,
        double quantity,
        const std::string& date,
        const std::string& referenceName = "SM-0001",
        std::optional<std::string> batch = std::nullopt,
        const std::string& item = "Widget")
    {
        return domain::StockLedgerEntry(item, location, std::move(batch), quantity,
                                        domain::Money::fromDouble(5.0),
                                        Timestamp::fromString(date),
                                        "StockMovement", referenceName);
    }

    InMemoryStockLedgerRepository repo_;
};

// ============================================================================
// BALANCE QUERY
// ============================================================================

TEST_F(InMemoryStockLedgerRepositoryTest, EmptyLedger_ReturnsAbsent) {
    auto quantity = repo_.getStockQuantity("Widget", "Warehouse", std::nullopt,
                                           BalanceDirection::BEFORE,
                                           Timestamp::fromString("2024-01-10"));

    EXPECT_FALSE(quantity.has_value());
}

TEST_F(InMemoryStockLedgerRepositoryTest, Before_SumsStrictlyEarlierEntries) {
    repo_.appendEntries({
        entry("Warehouse", 10, "2024-01-01"),
        entry("Warehouse", -3, "2024-01-05"),
        entry("Warehouse", 100, "2024-01-10"),
        entry("Warehouse", 50, "2024-01-11")
    });

    auto quantity = repo_.getStockQuantity("Widget", "Warehouse", std::nullopt,
                                           BalanceDirection::BEFORE,
                                           Timestamp::fromString("2024-01-10"));

    EXPECT_EQ(quantity, std::optional<double>(7));
}

TEST_F(InMemoryStockLedgerRepositoryTest, After_SumsStrictlyLaterEntries) {
    repo_.appendEntries({
        entry("Warehouse", 10, "2024-01-01"),
        entry("Warehouse", 100, "2024-01-10"),
        entry("Warehouse", -4, "2024-01-12"),
        entry("Warehouse", -2, "2024-01-15")
    });

    auto quantity = repo_.getStockQuantity("Widget", "Warehouse", std::nullopt,
                                           BalanceDirection::AFTER,
                                           Timestamp::fromString("2024-01-10"));

    EXPECT_EQ(quantity, std::optional<double>(-6));
}

TEST_F(InMemoryStockLedgerRepositoryTest, MatchingEntriesSummingToZero_AreNotAbsent) {
    repo_.appendEntries({
        entry("Warehouse", 5, "2024-01-01"),
        entry("Warehouse", -5, "2024-01-02")
    });

    auto quantity = repo_.getStockQuantity("Widget", "Warehouse", std::nullopt,
                                           BalanceDirection::BEFORE,
                                           Timestamp::fromString("2024-01-10"));

    ASSERT_TRUE(quantity.has_value());
    EXPECT_DOUBLE_EQ(*quantity, 0.0);
}

TEST_F(InMemoryStockLedgerRepositoryTest, FiltersByItemAndLocation) {
    repo_.appendEntries({
        entry("Warehouse", 10, "2024-01-01"),
        entry("Shop", 20, "2024-01-01"),
        entry("Warehouse", 40, "2024-01-01", "SM-0001", std::nullopt, "Gadget")
    });

    auto quantity = repo_.getStockQuantity("Widget", "Warehouse", std::nullopt,
                                           BalanceDirection::BEFORE,
                                           Timestamp::fromString("2024-01-10"));

    EXPECT_EQ(quantity, std::optional<double>(10));
}

TEST_F(InMemoryStockLedgerRepositoryTest, Batch_FiltersOnlyWhenGiven) {
    repo_.appendEntries({
        entry("Warehouse", 10, "2024-01-01", "SM-0001", std::string("B-1")),
        entry("Warehouse", 3, "2024-01-01", "SM-0001", std::string("B-2")),
        entry("Warehouse", 1, "2024-01-01")
    });
    auto date = Timestamp::fromString("2024-01-10");

    EXPECT_EQ(repo_.getStockQuantity("Widget", "Warehouse", std::string("B-1"),
                                     BalanceDirection::BEFORE, date),
              std::optional<double>(10));
    EXPECT_EQ(repo_.getStockQuantity("Widget", "Warehouse", std::nullopt,
                                     BalanceDirection::BEFORE, date),
              std::optional<double>(14));
    EXPECT_FALSE(repo_.getStockQuantity("Widget", "Warehouse", std::string("B-9"),
                                        BalanceDirection::BEFORE, date).has_value());
}

// ============================================================================
// APPEND / DELETE
// ============================================================================

TEST_F(InMemoryStockLedgerRepositoryTest, Append_KeepsInsertionOrder) {
    repo_.appendEntries({entry("X", -5, "2024-01-10"), entry("Y", 5, "2024-01-10")});
    repo_.appendEntries({entry("Z", 1, "2024-01-01")});

    auto all = repo_.getAll();

    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].location, "X");
    EXPECT_EQ(all[1].location, "Y");
    EXPECT_EQ(all[2].location, "Z");
}

TEST_F(InMemoryStockLedgerRepositoryTest, DeleteAllByReference_RemovesOnlyMatching) {
    repo_.appendEntries({
        entry("X", -5, "2024-01-10", "SM-0001"),
        entry("Y", 5, "2024-01-10", "SM-0001"),
        entry("Y", 2, "2024-01-10", "SM-0002")
    });

    EXPECT_EQ(repo_.deleteAllByReference("StockMovement", "SM-0001"), 2u);
    EXPECT_EQ(repo_.count(), 1u);
    EXPECT_TRUE(repo_.findByReference("StockMovement", "SM-0001").empty());
    EXPECT_EQ(repo_.findByReference("StockMovement", "SM-0002").size(), 1u);
}

TEST_F(InMemoryStockLedgerRepositoryTest, DeleteAllByReference_OtherTypeUntouched) {
    repo_.appendEntries({entry("X", 5, "2024-01-10", "SM-0001")});

    EXPECT_EQ(repo_.deleteAllByReference("Invoice", "SM-0001"), 0u);
    EXPECT_EQ(repo_.count(), 1u);
}

TEST_F(InMemoryStockLedgerRepositoryTest, Clear) {
    repo_.appendEntries({entry("X", 5, "2024-01-10")});

    repo_.clear();

    EXPECT_EQ(repo_.count(), 0u);
}
