#include "LoanApp.hpp"
#include <iostream>
#include <csignal>

namespace {

loan::LoanApp* runningApp = nullptr;

void onStopSignal(int signal) {
    std::cout << "\n[main] Signal " << signal << ": stopping loan-service" << std::endl;
    if (runningApp) {
        runningApp->stop();
    }
}

void printBanner() {
    std::cout << "========================================" << std::endl;
    std::cout << "  Loan Service v1.0.0" << std::endl;
    std::cout << "  POST /api/simple_loan  amortization schedule (JSON, CSV with export=csv)" << std::endl;
    std::cout << "  POST /api/calc         simple interest" << std::endl;
    std::cout << "  ENV LOAN_MAX_PAYMENTS  schedule length cap" << std::endl;
    std::cout << "========================================" << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    printBanner();

    try {
        loan::LoanApp app;
        runningApp = &app;

        std::signal(SIGINT, onStopSignal);
        std::signal(SIGTERM, onStopSignal);

        // loadEnvironment() -> configureInjection() -> start(), блокирует до stop()
        app.run(argc, argv);

        runningApp = nullptr;
        std::cout << "[main] Loan Service stopped" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        runningApp = nullptr;
        std::cerr << "[main] Loan Service failed to start: " << e.what() << std::endl;
        return 1;
    }
}
