#include "InventoryApp.hpp"

// Primary Adapters
#include "adapters/primary/TransferCommandHandler.hpp"

// Application Services
#include "application/StockTransferServiceFactory.hpp"

// Secondary Adapters
#include "adapters/secondary/persistence/InMemoryStockLedgerRepository.hpp"
#include "adapters/secondary/persistence/PostgresStockLedgerRepository.hpp"
#include "adapters/secondary/formatting/DateTimeFormatter.hpp"

// Settings
#include "settings/InventorySettings.hpp"

#include <boost/di.hpp>
#include <fstream>
#include <sstream>
#include <iostream>
#include <stdexcept>

namespace di = boost::di;

namespace inventory {

// ============================================================================
// InventoryApp Implementation
// ============================================================================

InventoryApp::InventoryApp()
{
    std::cout << "[InventoryApp] Application created" << std::endl;
}

InventoryApp::~InventoryApp()
{
    std::cout << "[InventoryApp] Application destroyed" << std::endl;
}

int InventoryApp::run(int argc, char* argv[])
{
    loadEnvironment(argc, argv);
    configureInjection();
    return processCommands();
}

void InventoryApp::loadEnvironment(int argc, char* argv[])
{
    std::cout << "[InventoryApp] Loading environment..." << std::endl;

    settings_ = std::make_shared<settings::InventorySettings>();

    for (int i = 1; i < argc; ++i) {
        commandFiles_.emplace_back(argv[i]);
    }

    if (commandFiles_.empty()) {
        throw std::invalid_argument("Usage: inventory_service <command.json> [<command.json> ...]");
    }

    std::cout << "[InventoryApp] Environment loaded successfully" << std::endl;
}

void InventoryApp::configureInjection()
{
    printStartupBanner();

    std::cout << "[InventoryApp] Configuring Boost.DI injection..." << std::endl;

    // Журнал и запрос остатков - один адаптер за двумя портами
    std::shared_ptr<ports::output::IStockLedgerRepository> ledger;
    std::shared_ptr<ports::output::IStockBalanceQuery> balanceQuery;

    if (settings_->usePostgres()) {
        auto repository = std::make_shared<adapters::secondary::PostgresStockLedgerRepository>(settings_);
        ledger = repository;
        balanceQuery = repository;
    } else {
        auto repository = std::make_shared<adapters::secondary::InMemoryStockLedgerRepository>();
        ledger = repository;
        balanceQuery = repository;
    }

    auto injector = di::make_injector(

        // ====================================================================
        // Layer 1: Settings + Secondary Adapters (Output Ports)
        // ====================================================================

        di::bind<settings::InventorySettings>().to(settings_),

        di::bind<ports::output::IStockLedgerRepository>().to(ledger),

        di::bind<ports::output::IStockBalanceQuery>().to(balanceQuery),

        // IDateFormatter ← DateTimeFormatter(InventorySettings)
        di::bind<ports::output::IDateFormatter>()
            .to<adapters::secondary::DateTimeFormatter>()
            .in(di::singleton),

        // ====================================================================
        // Layer 2: Application (Input Ports)
        // ====================================================================

        di::bind<ports::input::IStockTransferServiceFactory>()
            .to<application::StockTransferServiceFactory>()
            .in(di::singleton)
    );

    // Layer 3: Primary Adapter
    handler_ = injector.create<std::shared_ptr<adapters::primary::TransferCommandHandler>>();

    std::cout << "[InventoryApp] Injection configured" << std::endl;
}

int InventoryApp::processCommands()
{
    for (const auto& path : commandFiles_) {
        std::cout << "[InventoryApp] Processing " << path << std::endl;

        auto response = handler_->handle(readCommand(path));
        std::cout << response.dump(2) << std::endl;

        int code = adapters::primary::TransferCommandHandler::exitCode(response);
        if (code != 0) {
            std::cerr << "[InventoryApp] Command " << path << " finished with status "
                      << response.value("status", "error") << std::endl;
            return code;
        }
    }

    return 0;
}

std::string InventoryApp::readCommand(const std::string& path) const
{
    if (path == "-") {
        std::ostringstream ss;
        ss << std::cin.rdbuf();
        return ss.str();
    }

    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open command file: " + path);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

void InventoryApp::printStartupBanner()
{
    std::cout << "========================================" << std::endl;
    std::cout << "  Storage:     " << settings_->getStorage() << std::endl;
    if (settings_->usePostgres()) {
        std::cout << "  Database:    " << settings_->getDbHost() << ":" << settings_->getDbPort()
                  << "/" << settings_->getDbName() << std::endl;
    }
    std::cout << "  Date format: " << settings_->getDateFormat() << std::endl;
    std::cout << "  Commands:    " << commandFiles_.size() << std::endl;
    std::cout << "========================================" << std::endl;
}

} // namespace inventory
