// include/settings/InventorySettings.hpp
#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>

namespace inventory::settings {

/**
 * @brief Настройки сервиса остатков
 *
 * Читает параметры из переменных окружения.
 *
 * Переменные окружения:
 * - INVENTORY_STORAGE: memory, postgres
 * - INVENTORY_DATE_FORMAT: шаблон strftime для дат в сообщениях об ошибках
 * - INVENTORY_DB_HOST, INVENTORY_DB_PORT, INVENTORY_DB_NAME,
 *   INVENTORY_DB_USER, INVENTORY_DB_PASSWORD: журнал в PostgreSQL
 *
 * Параметры БД читаются всегда, но используются только при
 * INVENTORY_STORAGE=postgres.
 *
 * @example
 * ```
 * INVENTORY_STORAGE=postgres INVENTORY_DB_HOST=localhost \
 *     inventory_service transfer.json
 * ```
 */
class InventorySettings {
public:
    /**
     * @brief Конструктор - читает настройки из ENV
     * @throws std::invalid_argument при неизвестном INVENTORY_STORAGE
     *         или некорректном INVENTORY_DB_PORT
     */
    InventorySettings() {
        storage_ = getEnvOrDefault("INVENTORY_STORAGE", "memory");
        dateFormat_ = getEnvOrDefault("INVENTORY_DATE_FORMAT", "%Y-%m-%d %H:%M:%S");

        if (storage_ != "memory" && storage_ != "postgres") {
            throw std::invalid_argument("Unknown INVENTORY_STORAGE: " + storage_);
        }

        dbHost_ = getEnvOrDefault("INVENTORY_DB_HOST", "localhost");
        dbPort_ = parsePort(getEnvOrDefault("INVENTORY_DB_PORT", "5432"));
        dbName_ = getEnvOrDefault("INVENTORY_DB_NAME", "inventory");
        dbUser_ = getEnvOrDefault("INVENTORY_DB_USER", "inventory");
        dbPassword_ = getEnvOrDefault("INVENTORY_DB_PASSWORD", "");
    }

    /**
     * @brief Хранилище журнала: memory или postgres
     */
    std::string getStorage() const { return storage_; }

    bool usePostgres() const { return storage_ == "postgres"; }

    std::string getDateFormat() const { return dateFormat_; }

    std::string getDbHost() const { return dbHost_; }
    int getDbPort() const { return dbPort_; }
    std::string getDbName() const { return dbName_; }

    /**
     * @brief Строка подключения libpq (key=value)
     *
     * Пустой пароль не передаётся: libpq возьмёт его из ~/.pgpass.
     */
    std::string getDbConnectionString() const {
        std::string conn = "host=" + dbHost_ +
                           " port=" + std::to_string(dbPort_) +
                           " dbname=" + dbName_ +
                           " user=" + dbUser_;
        if (!dbPassword_.empty()) {
            conn += " password=" + dbPassword_;
        }
        return conn;
    }

private:
    std::string storage_;
    std::string dateFormat_;

    std::string dbHost_;
    int dbPort_ = 0;
    std::string dbName_;
    std::string dbUser_;
    std::string dbPassword_;

    static std::string getEnvOrDefault(const char* name, const char* defaultValue) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string(defaultValue);
    }

    static int parsePort(const std::string& value) {
        std::size_t parsed = 0;
        int port = 0;
        try {
            port = std::stoi(value, &parsed);
        } catch (const std::exception&) {
            throw std::invalid_argument("INVENTORY_DB_PORT is not a number: " + value);
        }

        if (parsed != value.size() || port < 1 || port > 65535) {
            throw std::invalid_argument("INVENTORY_DB_PORT out of range: " + value);
        }
        return port;
    }
};

} // namespace inventory::settings
