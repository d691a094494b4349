/**
 * @file SettingsTest.cpp
 * @brief Unit tests for environment-driven settings
 */

#include <gtest/gtest.h>
#include <cstdlib>

#include "settings/InventorySettings.hpp"
#include "adapters/secondary/formatting/DateTimeFormatter.hpp"

using namespace inventory;

class SettingsTest : public ::testing::Test {
protected:
    void TearDown() override {
        unsetenv("INVENTORY_STORAGE");
        unsetenv("INVENTORY_DATE_FORMAT");
        unsetenv("INVENTORY_DB_HOST");
        unsetenv("INVENTORY_DB_PORT");
        unsetenv("INVENTORY_DB_PASSWORD");
    }
};

TEST_F(SettingsTest, InventoryDefaults) {
    unsetenv("INVENTORY_STORAGE");
    unsetenv("INVENTORY_DATE_FORMAT");

    settings::InventorySettings settings;

    EXPECT_EQ(settings.getStorage(), "memory");
    EXPECT_FALSE(settings.usePostgres());
    EXPECT_EQ(settings.getDateFormat(), "%Y-%m-%d %H:%M:%S");
}

TEST_F(SettingsTest, PostgresStorage) {
    setenv("INVENTORY_STORAGE", "postgres", 1);

    settings::InventorySettings settings;

    EXPECT_TRUE(settings.usePostgres());
}

TEST_F(SettingsTest, UnknownStorage_Throws) {
    setenv("INVENTORY_STORAGE", "redis", 1);

    EXPECT_THROW(settings::InventorySettings(), std::invalid_argument);
}

TEST_F(SettingsTest, DbConnectionString) {
    setenv("INVENTORY_DB_HOST", "localhost", 1);
    setenv("INVENTORY_DB_PORT", "6543", 1);
    setenv("INVENTORY_DB_PASSWORD", "secret", 1);

    settings::InventorySettings settings;

    EXPECT_EQ(settings.getDbPort(), 6543);
    EXPECT_NE(settings.getDbConnectionString().find("host=localhost port=6543"), std::string::npos);
    EXPECT_NE(settings.getDbConnectionString().find("password=secret"), std::string::npos);
}

TEST_F(SettingsTest, EmptyDbPassword_IsOmitted) {
    unsetenv("INVENTORY_DB_PASSWORD");

    settings::InventorySettings settings;

    EXPECT_EQ(settings.getDbConnectionString().find("password="), std::string::npos);
}

TEST_F(SettingsTest, InvalidDbPort_ThrowsWithVariableName) {
    for (const char* port : {"abc", "54x", "0", "70000"}) {
        setenv("INVENTORY_DB_PORT", port, 1);
        try {
            settings::InventorySettings settings;
            ADD_FAILURE() << "Expected std::invalid_argument for port " << port;
        } catch (const std::invalid_argument& e) {
            EXPECT_NE(std::string(e.what()).find("INVENTORY_DB_PORT"), std::string::npos);
        }
    }
}

TEST_F(SettingsTest, DateTimeFormatter_UsesConfiguredPattern) {
    setenv("INVENTORY_DATE_FORMAT", "%d.%m.%Y", 1);

    adapters::secondary::DateTimeFormatter formatter(
        std::make_shared<settings::InventorySettings>());

    EXPECT_EQ(formatter.format(domain::Timestamp::fromString("2024-01-10 08:00:00")), "10.01.2024");
}
