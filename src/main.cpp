#include "PriceFetcherApp.hpp"
#include <csignal>
#include <iostream>

// Global pointer for signal handler
pricefetcher::PriceFetcherApp* g_app = nullptr;

void signalHandler(int signal) {
    std::cout << "\n[main] Received signal " << signal << ", shutting down..." << std::endl;
    if (g_app) {
        g_app->stop();
    }
}

int main(int argc, char* argv[])
{
    try {
        pricefetcher::PriceFetcherApp app;
        g_app = &app;

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        std::cout << "========================================" << std::endl;
        std::cout << "  WSB Price Fetcher Starting" << std::endl;
        std::cout << "  Health:   GET /health" << std::endl;
        std::cout << "  Price:    GET /price/AAPL" << std::endl;
        std::cout << "  Multiple: GET /prices?symbols=AAPL,TSLA,MSFT" << std::endl;
        std::cout << "  Groups:   GET /groups" << std::endl;
        std::cout << "  Press Ctrl+C to stop" << std::endl;
        std::cout << "========================================" << std::endl;

        // Template Method вызывает:
        // 1. loadEnvironment()
        // 2. configureInjection()
        // 3. start() - блокирует до stop()
        app.run(argc, argv);

        g_app = nullptr;
        std::cout << "[main] WSB Price Fetcher stopped" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
