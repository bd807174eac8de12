#pragma once

#include "domain/FetchError.hpp"
#include "ports/input/IQuoteService.hpp"
#include "ports/output/IQuoteProvider.hpp"

#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace pricefetcher::application {

/**
 * @brief Выбор провайдера по ProviderName
 *
 * Набор провайдеров закрыт: switch по enum проверяется компилятором
 * (-Wswitch), неизвестные внешние имена приводятся к MOCK ещё при разборе
 * запроса (см. adapters::primary::resolveProvider).
 */
class QuoteService : public ports::input::IQuoteService {
public:
    QuoteService(
        std::shared_ptr<ports::output::IQuoteProvider> yahoo,
        std::shared_ptr<ports::output::IQuoteProvider> alphaVantage,
        std::shared_ptr<ports::output::IQuoteProvider> mock
    ) : yahoo_(std::move(yahoo))
      , alphaVantage_(std::move(alphaVantage))
      , mock_(std::move(mock))
    {
        if (!yahoo_ || !alphaVantage_ || !mock_) {
            throw std::invalid_argument("QuoteService: all providers are required");
        }
        std::cout << "[QuoteService] Created" << std::endl;
    }

    domain::Quote fetch(const std::string& symbol, domain::ProviderName provider) override {
        auto quote = providerFor(provider).fetchQuote(symbol);

        std::ostringstream price;
        price << std::fixed << std::setprecision(2) << quote.price;
        std::cout << "[QuoteService] Fetched " << quote.symbol << " from "
                  << domain::toString(provider) << ": $" << price.str() << std::endl;

        return quote;
    }

private:
    std::shared_ptr<ports::output::IQuoteProvider> yahoo_;
    std::shared_ptr<ports::output::IQuoteProvider> alphaVantage_;
    std::shared_ptr<ports::output::IQuoteProvider> mock_;

    ports::output::IQuoteProvider& providerFor(domain::ProviderName provider) {
        switch (provider) {
            case domain::ProviderName::YAHOO: return *yahoo_;
            case domain::ProviderName::ALPHA_VANTAGE: return *alphaVantage_;
            case domain::ProviderName::MOCK: return *mock_;
        }
        return *mock_;
    }
};

} // namespace pricefetcher::application
