#include "BankApp.hpp"
#include <iostream>
#include <csignal>

namespace {

bank::BankApp* g_app = nullptr;

void onShutdownSignal(int signal) {
    std::cout << "\n[main] Signal " << signal << ", stopping..." << std::endl;
    if (g_app) {
        g_app->stop();
    }
}

/// Сводка конфигурации до запуска сервера
void printConfiguration() {
    bank::settings::StorageSettings storage;
    bank::settings::DbSettings db;
    bank::settings::RetrySettings retry;

    const bool memory = storage.getBackend() == bank::settings::StorageSettings::Backend::MEMORY;

    std::cout << "[main] storage=" << (memory ? "memory" : "postgres")
              << " rowLocking=" << (db.isRowLockingEnabled() ? "on" : "off")
              << " lockTimeout=" << db.getLockTimeoutMs() << "ms"
              << " retry=" << retry.getMaxAttempts() << "x" << retry.getBackoff().count() << "ms"
              << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        printConfiguration();

        bank::BankApp app;
        g_app = &app;

        std::signal(SIGINT, onShutdownSignal);
        std::signal(SIGTERM, onShutdownSignal);

        std::cout << "[main] Bank Service starting (Ctrl+C to stop)" << std::endl;
        app.run(argc, argv);

        g_app = nullptr;
        std::cout << "[main] Bank Service stopped" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        g_app = nullptr;
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
