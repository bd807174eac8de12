#pragma once

#include <BoostBeastApplication.hpp>

#include <string>
#include <vector>

namespace pricefetcher {

/**
 * @brief WSB Price Fetcher
 *
 * Template Method (BoostBeastApplication::run):
 * 1. loadEnvironment()    - настройки из ENV
 * 2. configureInjection() - Boost.DI граф провайдеров и handlers
 * 3. start()              - HTTP сервер, блокирует до stop()
 *
 * HTTP:
 * - GET /health
 * - GET /price/{symbol}?source=
 * - GET /prices?symbols=A,B,C&source=
 * - GET /groups
 * - OPTIONS на каждый маршрут (CORS preflight)
 */
class PriceFetcherApp : public BoostBeastApplication {
public:
    PriceFetcherApp();
    ~PriceFetcherApp() override;

    /// Шаблоны путей всех маршрутов сервиса
    static const std::vector<std::string>& routePatterns();

protected:
    void loadEnvironment(int argc, char* argv[]) override;
    void configureInjection() override;
};

} // namespace pricefetcher
