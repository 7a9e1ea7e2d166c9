#include "SessionMaintenanceApp.hpp"
#include <iostream>

int main(int argc, char* argv[]) {
    try {
        sessions::SessionMaintenanceApp app;

        // Template Method вызывает:
        // 1. loadEnvironment()
        // 2. configureInjection()
        // 3. execute()
        return app.run(argc, argv);

    } catch (const std::exception& e) {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return sessions::SessionMaintenanceApp::EXIT_FAILURE_RUNTIME;
    }
}
