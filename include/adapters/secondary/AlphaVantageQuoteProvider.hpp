#pragma once

#include "adapters/secondary/MockQuoteProvider.hpp"
#include "ports/output/IQuoteProvider.hpp"

#include <iostream>
#include <memory>

namespace pricefetcher::adapters::secondary {

/**
 * @brief Заглушка Alpha Vantage
 *
 * Реальная интеграция требует API ключа, которым сервис не управляет,
 * поэтому запрос всегда отдаётся синтетическому провайдеру.
 */
class AlphaVantageQuoteProvider : public ports::output::IQuoteProvider {
public:
    explicit AlphaVantageQuoteProvider(std::shared_ptr<MockQuoteProvider> fallback)
        : fallback_(std::move(fallback))
    {
        std::cout << "[AlphaVantageQuoteProvider] Created (stub)" << std::endl;
    }

    domain::Quote fetchQuote(const std::string& symbol) override {
        std::cerr << "[AlphaVantageQuoteProvider] Alpha Vantage requires API key, using mock data for "
                  << symbol << std::endl;
        return fallback_->fetchQuote(symbol);
    }

private:
    std::shared_ptr<MockQuoteProvider> fallback_;
};

} // namespace pricefetcher::adapters::secondary
