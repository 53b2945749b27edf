#include "LoanApp.hpp"
#include <iostream>
#include <csignal>
#include <stdexcept>

namespace {

loans::LoanApp* runningApp = nullptr;

void onShutdownSignal(int signal) {
    std::cout << "\n[main] Signal " << signal << ", stopping loan-service..." << std::endl;
    if (runningApp) {
        runningApp->stop();
    }
}

} // namespace

int main(int argc, char* argv[]) {
    std::cout << "[main] Loan Service v1.0.0" << std::endl;

    try {
        loans::LoanApp app;
        runningApp = &app;

        std::signal(SIGINT, onShutdownSignal);
        std::signal(SIGTERM, onShutdownSignal);

        // loadEnvironment() → configureInjection() → start()
        app.run(argc, argv);

        runningApp = nullptr;
        std::cout << "[main] Loan Service stopped" << std::endl;
        return 0;

    } catch (const std::invalid_argument& e) {
        // Некорректные LOANS_* / SERVER_* переменные окружения
        std::cerr << "[main] Configuration error: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
