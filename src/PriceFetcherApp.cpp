#include "PriceFetcherApp.hpp"

// Settings
#include "settings/AggregatorSettings.hpp"
#include "settings/ServerSettings.hpp"
#include "settings/YahooClientSettings.hpp"

// Secondary adapters
#include "adapters/secondary/AlphaVantageQuoteProvider.hpp"
#include "adapters/secondary/HttpsClient.hpp"
#include "adapters/secondary/MockQuoteProvider.hpp"
#include "adapters/secondary/SystemClock.hpp"
#include "adapters/secondary/YahooQuoteProvider.hpp"

// Application
#include "application/PriceAggregator.hpp"
#include "application/QuoteService.hpp"
#include "application/StockGroupCatalog.hpp"

// Primary adapters
#include "adapters/primary/CorsHandler.hpp"
#include "adapters/primary/GetGroupsHandler.hpp"
#include "adapters/primary/GetPriceHandler.hpp"
#include "adapters/primary/GetPricesHandler.hpp"
#include "adapters/primary/HealthHandler.hpp"

#include <boost/di.hpp>
#include <cstdlib>
#include <iostream>

namespace di = boost::di;

namespace pricefetcher {

using namespace adapters::primary;
using namespace adapters::secondary;

PriceFetcherApp::PriceFetcherApp()
{
    std::cout << "[PriceFetcherApp] Initializing..." << std::endl;
}

PriceFetcherApp::~PriceFetcherApp()
{
    std::cout << "[PriceFetcherApp] Shutting down..." << std::endl;
}

const std::vector<std::string>& PriceFetcherApp::routePatterns()
{
    static const std::vector<std::string> patterns = {"/health", "/price/*", "/prices", "/groups"};
    return patterns;
}

void PriceFetcherApp::loadEnvironment(int argc, char* argv[])
{
    // Порт по умолчанию 3000 и алиас PORT: экспортируем итоговые значения
    // в SERVER_HOST/SERVER_PORT до того, как их прочитает BoostBeastApplication
    settings::ServerSettings server;
    ::setenv("SERVER_HOST", server.getHost().c_str(), 1);
    ::setenv("SERVER_PORT", std::to_string(server.getPort()).c_str(), 1);

    BoostBeastApplication::loadEnvironment(argc, argv);
    std::cout << "[PriceFetcherApp] Environment loaded, listen "
              << server.getHost() << ":" << server.getPort() << std::endl;
}

void PriceFetcherApp::configureInjection()
{
    std::cout << "[PriceFetcherApp] Configuring DI..." << std::endl;

    // Шаг 1: настройки; HttpsClient принимает таймаут, поэтому создаём его явно
    auto settingsInjector = di::make_injector(
        di::bind<settings::IYahooClientSettings>().to<settings::YahooClientSettings>().in(di::singleton),
        di::bind<settings::IAggregatorSettings>().to<settings::AggregatorSettings>().in(di::singleton));

    auto yahooSettings = settingsInjector.create<std::shared_ptr<settings::IYahooClientSettings>>();
    auto aggregatorSettings = settingsInjector.create<std::shared_ptr<settings::IAggregatorSettings>>();
    std::shared_ptr<IHttpClient> httpClient = std::make_shared<HttpsClient>(yahooSettings->getTimeout());

    // Шаг 2: провайдеры котировок
    auto providerInjector = di::make_injector(
        di::bind<settings::IYahooClientSettings>().to(yahooSettings),
        di::bind<IHttpClient>().to(httpClient),
        di::bind<ports::output::IClock>().to<SystemClock>().in(di::singleton),
        di::bind<MockQuoteProvider>().in(di::singleton));

    auto clock = providerInjector.create<std::shared_ptr<ports::output::IClock>>();
    auto mock = providerInjector.create<std::shared_ptr<MockQuoteProvider>>();
    auto yahoo = providerInjector.create<std::shared_ptr<YahooQuoteProvider>>();
    auto alphaVantage = providerInjector.create<std::shared_ptr<AlphaVantageQuoteProvider>>();

    // Шаг 3: три провайдера одного интерфейса, поэтому QuoteService собираем явно
    auto quoteService = std::make_shared<application::QuoteService>(yahoo, alphaVantage, mock);

    // Шаг 4: сервисы и handlers
    auto injector = di::make_injector(
        di::bind<ports::output::IClock>().to(clock),
        di::bind<settings::IAggregatorSettings>().to(aggregatorSettings),
        di::bind<ports::input::IQuoteService>().to(quoteService),
        di::bind<ports::input::IPriceAggregator>().to<application::PriceAggregator>().in(di::singleton),
        di::bind<ports::input::IStockGroupService>().to<application::StockGroupCatalog>().in(di::singleton));

    // Все ответы, включая ошибки, проходят через CorsHandler
    handlers_[getHandlerKey("GET", "/health")] =
        std::make_shared<CorsHandler>(injector.create<std::shared_ptr<HealthHandler>>());
    handlers_[getHandlerKey("GET", "/price/*")] =
        std::make_shared<CorsHandler>(injector.create<std::shared_ptr<GetPriceHandler>>());
    handlers_[getHandlerKey("GET", "/prices")] =
        std::make_shared<CorsHandler>(injector.create<std::shared_ptr<GetPricesHandler>>());
    handlers_[getHandlerKey("GET", "/groups")] =
        std::make_shared<CorsHandler>(injector.create<std::shared_ptr<GetGroupsHandler>>());

    auto preflight = std::make_shared<CorsHandler>(std::make_shared<PreflightHandler>());
    for (const auto& pattern : routePatterns()) {
        handlers_[getHandlerKey("OPTIONS", pattern)] = preflight;
    }

    std::cout << "[PriceFetcherApp] DI configuration completed" << std::endl;
}

} // namespace pricefetcher
