// include/adapters/secondary/persistence/PostgresStockLedgerRepository.hpp
#pragma once

#include "ports/output/IStockLedgerRepository.hpp"
#include "ports/output/IStockBalanceQuery.hpp"
#include "settings/InventorySettings.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <string>
#include <iostream>

namespace inventory::adapters::secondary {

/**
 * @brief PostgreSQL реализация журнала остатков
 *
 * Таблица: stock_ledger_entries
 * - id BIGSERIAL PRIMARY KEY
 * - item VARCHAR(140) NOT NULL
 * - location VARCHAR(140) NOT NULL
 * - batch VARCHAR(140) NULL
 * - quantity DOUBLE PRECISION NOT NULL  (со знаком)
 * - rate_units BIGINT, rate_nano INTEGER, rate_currency VARCHAR(3)
 * - date TIMESTAMP NOT NULL  (UTC)
 * - reference_type VARCHAR(140) NOT NULL
 * - reference_name VARCHAR(140) NOT NULL
 *
 * Каждый appendEntries выполняется одной транзакцией. Соединение
 * открывается на каждый вызов.
 *
 * Зависимости:
 * - libpqxx (CMake: find_package(libpqxx REQUIRED))
 */
class PostgresStockLedgerRepository
    : public ports::output::IStockLedgerRepository
    , public ports::output::IStockBalanceQuery
{
public:
    explicit PostgresStockLedgerRepository(std::shared_ptr<settings::InventorySettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresLedger] Connecting to " << settings_->getDbHost()
                  << "/" << settings_->getDbName() << std::endl;
        initSchema();
    }

    void appendEntries(const std::vector<domain::StockLedgerEntry>& entries) override {
        if (entries.empty()) {
            return;
        }

        try {
            pqxx::connection conn(settings_->getDbConnectionString());
            pqxx::work txn(conn);

            for (const auto& e : entries) {
                txn.exec_params(
                    "INSERT INTO stock_ledger_entries ("
                    "item, location, batch, quantity, "
                    "rate_units, rate_nano, rate_currency, date, "
                    "reference_type, reference_name) "
                    "VALUES ($1, $2, $3, $4, $5, $6, $7, $8::timestamp, $9, $10)",
                    e.item,
                    e.location,
                    e.batch,
                    e.quantity,
                    e.rate.units,
                    e.rate.nano,
                    e.rate.currency,
                    timestampToString(e.date),
                    e.referenceType,
                    e.referenceName
                );
            }

            txn.commit();
            std::cout << "[PostgresLedger] Appended " << entries.size() << " entries" << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedger] appendEntries() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::size_t deleteAllByReference(
        const std::string& referenceType,
        const std::string& referenceName
    ) override {
        try {
            pqxx::connection conn(settings_->getDbConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "DELETE FROM stock_ledger_entries "
                "WHERE reference_type = $1 AND reference_name = $2",
                referenceType,
                referenceName
            );

            txn.commit();

            std::cout << "[PostgresLedger] Deleted " << result.affected_rows() << " entries of "
                      << referenceType << "/" << referenceName << std::endl;
            return static_cast<std::size_t>(result.affected_rows());

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedger] deleteAllByReference() failed: " << e.what() << std::endl;
            throw;
        }
    }

    /**
     * @brief SUM(quantity) по одну сторону от даты
     *
     * SUM по пустому набору даёт NULL → std::nullopt.
     */
    std::optional<double> getStockQuantity(
        const std::string& item,
        const std::string& location,
        const std::optional<std::string>& batch,
        domain::BalanceDirection direction,
        const domain::Timestamp& date
    ) override {
        const std::string comparison =
            direction == domain::BalanceDirection::BEFORE ? "<" : ">";

        try {
            pqxx::connection conn(settings_->getDbConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT SUM(quantity) AS total FROM stock_ledger_entries "
                "WHERE item = $1 AND location = $2 "
                "AND ($3::text IS NULL OR batch = $3::text) "
                "AND date " + comparison + " $4::timestamp",
                item,
                location,
                batch,
                timestampToString(date)
            );

            txn.commit();

            if (result.empty() || result[0]["total"].is_null()) {
                return std::nullopt;
            }

            return result[0]["total"].as<double>();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedger] getStockQuantity() failed: " << e.what() << std::endl;
            throw;
        }
    }

private:
    std::shared_ptr<settings::InventorySettings> settings_;

    void initSchema() {
        try {
            pqxx::connection conn(settings_->getDbConnectionString());
            pqxx::work txn(conn);

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS stock_ledger_entries (
                    id BIGSERIAL PRIMARY KEY,
                    item VARCHAR(140) NOT NULL,
                    location VARCHAR(140) NOT NULL,
                    batch VARCHAR(140),
                    quantity DOUBLE PRECISION NOT NULL,
                    rate_units BIGINT NOT NULL DEFAULT 0,
                    rate_nano INTEGER NOT NULL DEFAULT 0,
                    rate_currency VARCHAR(3) NOT NULL DEFAULT 'USD',
                    date TIMESTAMP NOT NULL,
                    reference_type VARCHAR(140) NOT NULL,
                    reference_name VARCHAR(140) NOT NULL,
                    created_at TIMESTAMP DEFAULT NOW()
                )
            )");
            txn.exec(R"(
                CREATE INDEX IF NOT EXISTS idx_sle_item_location_date
                    ON stock_ledger_entries (item, location, date)
            )");
            txn.exec(R"(
                CREATE INDEX IF NOT EXISTS idx_sle_reference
                    ON stock_ledger_entries (reference_type, reference_name)
            )");

            txn.commit();
            std::cout << "[PostgresLedger] Schema initialized" << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedger] initSchema error: " << e.what() << std::endl;
            throw;
        }
    }

    std::string timestampToString(const domain::Timestamp& ts) const {
        return ts.format("%Y-%m-%d %H:%M:%S");
    }
};

} // namespace inventory::adapters::secondary
