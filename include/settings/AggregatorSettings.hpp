#pragma once

#include "settings/EnvReader.hpp"
#include "settings/IAggregatorSettings.hpp"

namespace pricefetcher::settings {

/**
 * @brief Настройки batch-запросов
 *
 * Читает из ENV:
 * - PRICE_FETCH_CONCURRENCY (default: 8) — размер пула потоков агрегатора
 */
class AggregatorSettings : public IAggregatorSettings {
public:
    AggregatorSettings() {
        int concurrency = readEnvInt("PRICE_FETCH_CONCURRENCY", static_cast<int>(concurrency_));
        if (concurrency > 0) {
            concurrency_ = static_cast<std::size_t>(concurrency);
        }
    }

    std::size_t getConcurrency() const override { return concurrency_; }

private:
    std::size_t concurrency_ = 8;
};

} // namespace pricefetcher::settings
