#include "InventoryApp.hpp"
#include <iostream>

int main(int argc, char* argv[]) {
    try {
        inventory::InventoryApp app;

        std::cout << "========================================" << std::endl;
        std::cout << "  Inventory Service v1.0.0 Starting" << std::endl;
        std::cout << "========================================" << std::endl;

        // Template Method вызывает:
        // 1. loadEnvironment()
        // 2. configureInjection()
        // 3. processCommands()
        int code = app.run(argc, argv);

        std::cout << "[main] Inventory Service stopped" << std::endl;
        return code;

    } catch (const std::exception& e) {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
