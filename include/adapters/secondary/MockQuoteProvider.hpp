#pragma once

#include "ports/output/IClock.hpp"
#include "ports/output/IQuoteProvider.hpp"

#include <cmath>
#include <iostream>
#include <memory>
#include <string>
#include <unordered_map>

namespace pricefetcher::adapters::secondary {

/**
 * @brief Синтетический провайдер котировок (source = "mock")
 *
 * Цена детерминирована текущей секундой:
 *   v     = (now % 100) / 100 - 0.5          // [-0.5, 0.5)
 *   price = round2(base * (1 + v * 0.1))     // ±5% от базовой
 *   change_24h = v * 5, change_percent_24h = v * 2
 *
 * Базовая цена берётся из таблицы известных тикеров,
 * для остальных: 100 + 10 * длина тикера.
 *
 * Округление до центов: half away from zero (std::round).
 * Никогда не бросает исключений.
 */
class MockQuoteProvider : public ports::output::IQuoteProvider {
public:
    static constexpr const char* SOURCE = "mock";

    explicit MockQuoteProvider(std::shared_ptr<ports::output::IClock> clock)
        : clock_(std::move(clock))
    {
        std::cout << "[MockQuoteProvider] Created" << std::endl;
    }

    domain::Quote fetchQuote(const std::string& symbol) override {
        const std::int64_t now = clock_->nowSeconds();
        const double v = variation(now);
        const double price = roundToCents(basePrice(symbol) * (1.0 + v * 0.1));

        return domain::Quote(symbol, price, "USD", now, SOURCE, v * 5.0, v * 2.0);
    }

    /**
     * @brief Базовая цена тикера
     */
    static double basePrice(const std::string& symbol) {
        static const std::unordered_map<std::string, double> basePrices = {
            {"AAPL", 150.0},
            {"TSLA", 200.0},
            {"MSFT", 300.0},
            {"GOOGL", 2500.0},
            {"AMZN", 3000.0},
            {"NVDA", 400.0},
            {"META", 250.0},
            {"NFLX", 400.0}
        };

        auto it = basePrices.find(symbol);
        if (it != basePrices.end()) {
            return it->second;
        }
        return 100.0 + 10.0 * static_cast<double>(symbol.size());
    }

    /**
     * @brief Фактор вариации в [-0.5, 0.5)
     */
    static double variation(std::int64_t unixSeconds) {
        // Для отрицательного времени берём неотрицательный остаток
        std::int64_t rem = ((unixSeconds % 100) + 100) % 100;
        return static_cast<double>(rem) / 100.0 - 0.5;
    }

    static double roundToCents(double value) {
        return std::round(value * 100.0) / 100.0;
    }

private:
    std::shared_ptr<ports::output::IClock> clock_;
};

} // namespace pricefetcher::adapters::secondary
