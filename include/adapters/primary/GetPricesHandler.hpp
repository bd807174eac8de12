#pragma once

#include "adapters/primary/ResponseUtils.hpp"
#include "domain/BatchResult.hpp"
#include "domain/Symbol.hpp"
#include "ports/input/IPriceAggregator.hpp"
#include "utils/UrlCodec.hpp"

#include <IHttpHandler.hpp>
#include <iostream>
#include <memory>

namespace pricefetcher::adapters::primary
{

    /**
     * @brief GET /prices?symbols=AAPL,TSLA,MSFT&source=...
     *
     * 200 — массив успешно полученных котировок. Тикеры с ошибкой
     * в ответ не попадают (формат ответа зафиксирован клиентами).
     * 400 MISSING_SYMBOLS — параметр не задан, провайдеры не вызываются.
     * 400 ALL_PRICES_FAILED — не получен ни один тикер.
     */
    class GetPricesHandler : public IHttpHandler
    {
    public:
        explicit GetPricesHandler(std::shared_ptr<ports::input::IPriceAggregator> aggregator)
            : aggregator_(std::move(aggregator))
        {
            std::cout << "[GetPricesHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            if (req.getMethod() != "GET")
            {
                sendError(res, 405, "METHOD_NOT_ALLOWED", "Method not allowed");
                return;
            }

            auto symbols = domain::splitSymbols(utils::urlDecode(req.getQueryParam("symbols").value_or(""), true));
            if (symbols.empty())
            {
                sendError(res, 400, "MISSING_SYMBOLS",
                          "Missing 'symbols' parameter. Use comma-separated values like: ?symbols=AAPL,TSLA,MSFT");
                return;
            }

            const auto provider = resolveProvider(req);

            try
            {
                auto batch = aggregator_->fetchBatch(symbols, provider);

                nlohmann::json response = nlohmann::json::array();
                for (const auto &quote : batch.quotes)
                {
                    response.push_back(quoteToJson(quote));
                }

                std::cout << "[GetPricesHandler] Returned " << batch.quotes.size() << " of "
                          << symbols.size() << " prices" << std::endl;
                sendJson(res, 200, response);
            }
            catch (const domain::AllPricesFailedError &e)
            {
                std::cerr << "[GetPricesHandler] " << e.what() << std::endl;
                sendError(res, 400, "ALL_PRICES_FAILED", e.what());
            }
            catch (const std::exception &e)
            {
                std::cerr << "[GetPricesHandler] Batch failed: " << e.what() << std::endl;
                sendError(res, 500, "INTERNAL_ERROR", "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::IPriceAggregator> aggregator_;
    };

} // namespace pricefetcher::adapters::primary
