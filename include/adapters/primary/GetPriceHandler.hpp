#pragma once

#include "adapters/primary/ResponseUtils.hpp"
#include "domain/FetchError.hpp"
#include "domain/Symbol.hpp"
#include "ports/input/IQuoteService.hpp"
#include "utils/UrlCodec.hpp"

#include <IHttpHandler.hpp>
#include <iostream>
#include <memory>
#include <string>

namespace pricefetcher::adapters::primary
{

    /**
     * @brief GET /price/{symbol}?source=yahoo|alpha_vantage|mock
     *
     * Response (200 OK):
     * {
     *   "symbol": "AAPL", "price": 150.23, "currency": "USD",
     *   "timestamp": 1734185445, "source": "yahoo",
     *   "change_24h": 1.2, "change_percent_24h": 0.8
     * }
     *
     * Response (400):
     * {"error": "PRICE_FETCH_FAILED", "message": "Failed to fetch price for AAPL: HTTP error: 404"}
     */
    class GetPriceHandler : public IHttpHandler
    {
    public:
        explicit GetPriceHandler(std::shared_ptr<ports::input::IQuoteService> quoteService)
            : quoteService_(std::move(quoteService))
        {
            std::cout << "[GetPriceHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            if (req.getMethod() != "GET")
            {
                sendError(res, 405, "METHOD_NOT_ALLOWED", "Method not allowed");
                return;
            }

            const std::string symbol = extractSymbol(req);
            if (symbol.empty())
            {
                sendError(res, 400, "MISSING_SYMBOL", "Missing symbol in path. Use /price/AAPL");
                return;
            }

            const auto provider = resolveProvider(req);
            std::cout << "[GetPriceHandler] Fetching price for " << symbol
                      << " from " << domain::toString(provider) << std::endl;

            try
            {
                auto quote = quoteService_->fetch(symbol, provider);
                sendJson(res, 200, quoteToJson(quote));
            }
            catch (const std::exception &e)
            {
                std::cerr << "[GetPriceHandler] Failed to fetch price for " << symbol << ": " << e.what() << std::endl;
                sendError(res, 400, "PRICE_FETCH_FAILED",
                          "Failed to fetch price for " + symbol + ": " + e.what());
            }
        }

    private:
        std::shared_ptr<ports::input::IQuoteService> quoteService_;

        static std::string extractSymbol(IRequest &req)
        {
            auto segment = req.getPathParam(0).value_or("");
            return domain::normalizeSymbol(utils::urlDecode(segment));
        }
    };

} // namespace pricefetcher::adapters::primary
