#pragma once

#include "domain/BatchResult.hpp"
#include "domain/Symbol.hpp"
#include "ports/input/IPriceAggregator.hpp"
#include "ports/input/IQuoteService.hpp"
#include "settings/IAggregatorSettings.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <algorithm>
#include <future>
#include <iostream>
#include <memory>
#include <optional>

namespace pricefetcher::application {

/**
 * @brief Пакетное получение котировок
 *
 * Тикеры запрашиваются на собственном пуле из getConcurrency() потоков:
 * одновременно в полёте не больше этого числа запросов, сколько бы
 * тикеров ни пришло. Результаты собираются в исходном порядке, поэтому
 * содержимое BatchResult не зависит от того, какая задача завершилась первой.
 */
class PriceAggregator : public ports::input::IPriceAggregator {
public:
    PriceAggregator(
        std::shared_ptr<ports::input::IQuoteService> quoteService,
        std::shared_ptr<settings::IAggregatorSettings> settings
    ) : quoteService_(std::move(quoteService))
      , concurrency_(std::max<std::size_t>(1, settings->getConcurrency()))
      , pool_(concurrency_)
    {
        std::cout << "[PriceAggregator] Created, concurrency: " << concurrency_ << std::endl;
    }

    ~PriceAggregator() override {
        pool_.join();
    }

    domain::BatchResult fetchBatch(const std::vector<std::string>& symbols,
                                   domain::ProviderName provider) override {
        std::vector<std::string> normalized;
        normalized.reserve(symbols.size());
        for (const auto& raw : symbols) {
            auto symbol = domain::normalizeSymbol(raw);
            if (!symbol.empty()) {
                normalized.push_back(std::move(symbol));
            }
        }

        std::cout << "[PriceAggregator] Fetching prices for " << normalized.size()
                  << " symbols from " << domain::toString(provider) << std::endl;

        std::vector<std::future<Outcome>> pending;
        pending.reserve(normalized.size());
        for (const auto& symbol : normalized) {
            auto task = std::make_shared<std::packaged_task<Outcome()>>(
                [this, symbol, provider]() { return fetchOne(symbol, provider); });
            pending.push_back(task->get_future());
            boost::asio::post(pool_, [task]() { (*task)(); });
        }

        domain::BatchResult result;
        for (size_t i = 0; i < pending.size(); ++i) {
            Outcome outcome = pending[i].get();
            if (outcome.quote) {
                result.quotes.push_back(std::move(*outcome.quote));
            } else {
                std::cerr << "[PriceAggregator] Failed to fetch price for " << normalized[i]
                          << ": " << outcome.error << std::endl;
                result.failures.push_back({normalized[i], outcome.error});
            }
        }

        if (result.allFailed()) {
            throw domain::AllPricesFailedError(result.failures);
        }

        return result;
    }

private:
    struct Outcome {
        std::optional<domain::Quote> quote;
        std::string error;
    };

    std::shared_ptr<ports::input::IQuoteService> quoteService_;
    std::size_t concurrency_;
    boost::asio::thread_pool pool_;

    Outcome fetchOne(const std::string& symbol, domain::ProviderName provider) {
        Outcome outcome;
        try {
            outcome.quote = quoteService_->fetch(symbol, provider);
        } catch (const std::exception& e) {
            outcome.error = e.what();
        }
        return outcome;
    }
};

} // namespace pricefetcher::application
