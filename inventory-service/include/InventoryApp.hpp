#pragma once

#include <memory>
#include <string>
#include <vector>

namespace inventory::settings {
    class InventorySettings;
}

namespace inventory::adapters::primary {
    class TransferCommandHandler;
}

namespace inventory {

/**
 * @class InventoryApp
 * @brief Приложение сервиса остатков
 *
 * Template Method:
 * 1. loadEnvironment() - настройки из ENV и список файлов команд
 * 2. configureInjection() - Boost.DI: порты → адаптеры
 * 3. processCommands() - выполнение команд по порядку
 *
 * Архитектура: Hexagonal (Ports & Adapters)
 * - Primary Adapter: TransferCommandHandler (JSON-команды)
 * - Secondary Adapters: PostgresStockLedgerRepository / InMemoryStockLedgerRepository,
 *   DateTimeFormatter
 */
class InventoryApp
{
public:
    InventoryApp();
    ~InventoryApp();

    /**
     * @brief Запустить приложение
     * @return Код завершения: 0 - ok, 2 - отклонено валидацией, 1 - ошибка
     */
    int run(int argc, char* argv[]);

protected:
    void loadEnvironment(int argc, char* argv[]);

    void configureInjection();

    int processCommands();

private:
    std::shared_ptr<settings::InventorySettings> settings_;
    std::shared_ptr<adapters::primary::TransferCommandHandler> handler_;
    std::vector<std::string> commandFiles_;

    void printStartupBanner();
    std::string readCommand(const std::string& path) const;
};

} // namespace inventory
