#include "InventoryApp.hpp"
#include <csignal>
#include <iostream>

namespace {

inventory::InventoryApp* runningApp = nullptr;

void onShutdownSignal(int signal) {
    std::cout << "\n[main] Signal " << signal << ": stopping sweeper and HTTP server" << std::endl;
    if (runningApp) {
        runningApp->stop();
    }
}

void printBanner() {
    inventory::settings::StorageSettings storage;
    inventory::settings::SweeperSettings sweeper;

    std::cout << "========================================" << std::endl;
    std::cout << "  Inventory Service v1.0.0" << std::endl;
    std::cout << "  storage: " << storage.getBackend()
              << ", lock timeout " << storage.getLockTimeout().count() << " ms" << std::endl;
    std::cout << "  sweeper: " << (sweeper.isEnabled() ? "on" : "off") << std::endl;
    std::cout << "========================================" << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        printBanner();

        inventory::InventoryApp app;
        runningApp = &app;

        // SIGTERM приходит от оркестратора при остановке пода
        std::signal(SIGINT, onShutdownSignal);
        std::signal(SIGTERM, onShutdownSignal);

        app.run(argc, argv);

        runningApp = nullptr;
        std::cout << "[main] Inventory Service stopped" << std::endl;
        return 0;

    } catch (const inventory::domain::InventoryException& e) {
        std::cerr << "[main] Startup failed (" << inventory::domain::toString(e.code())
                  << "): " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
