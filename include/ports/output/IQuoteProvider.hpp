#pragma once

#include "domain/Quote.hpp"
#include <string>

namespace pricefetcher::ports::output {

/**
 * @brief Источник котировок (upstream API или генератор)
 */
class IQuoteProvider {
public:
    virtual ~IQuoteProvider() = default;

    /**
     * @throws domain::FetchError
     */
    virtual domain::Quote fetchQuote(const std::string& symbol) = 0;
};

} // namespace pricefetcher::ports::output
