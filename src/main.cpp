#include "PaymentApp.hpp"
#include <iostream>
#include <csignal>
#include <stdexcept>

namespace {

constexpr const char* SERVICE_VERSION = "1.0.0";

// Код выхода при ошибке в ENV: под K8s отличаем от падения в работе
constexpr int EXIT_CONFIG_ERROR = 2;

payment::PaymentApp* g_app = nullptr;

void handleShutdownSignal(int signal) {
    std::cout << "\n[main] Received signal " << signal
              << ", shutting down..." << std::endl;
    if (g_app) {
        g_app->stop();
    }
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        payment::PaymentApp app;
        g_app = &app;

        std::signal(SIGINT, handleShutdownSignal);
        std::signal(SIGTERM, handleShutdownSignal);

        std::cout << "[main] Payment Service v" << SERVICE_VERSION << " starting" << std::endl;

        // Настройки читаются из ENV при сборке инжектора, до открытия порта
        app.run(argc, argv);

        g_app = nullptr;
        std::cout << "[main] Payment Service stopped" << std::endl;
        return 0;

    } catch (const std::invalid_argument& e) {
        // std::stoi на нечисловом ENV бросает то же исключение
        std::cerr << "[main] Configuration error: " << e.what() << std::endl;
        return EXIT_CONFIG_ERROR;
    } catch (const std::exception& e) {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
