#pragma once

#include "domain/FetchError.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/IQuoteProvider.hpp"
#include "settings/IYahooClientSettings.hpp"
#include "utils/UrlCodec.hpp"

#include <IHttpClient.hpp>
#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace pricefetcher::adapters::secondary {

/**
 * @brief Котировки из Yahoo Finance chart API
 *
 * GET https://query1.finance.yahoo.com/v8/finance/chart/{symbol}
 *
 * Из ответа используется только chart.result[0].meta:
 * - regularMarketPrice          — обязательное поле
 * - currency                    — по умолчанию "USD"
 * - regularMarketChange         — как есть, иначе null
 * - regularMarketChangePercent  — как есть, иначе null
 *
 * timestamp котировки — момент получения ответа, а не время сделки
 * из upstream (совместимость с существующими клиентами).
 */
class YahooQuoteProvider : public ports::output::IQuoteProvider {
public:
    static constexpr const char* SOURCE = "yahoo";

    YahooQuoteProvider(
        std::shared_ptr<IHttpClient> httpClient,
        std::shared_ptr<settings::IYahooClientSettings> settings,
        std::shared_ptr<ports::output::IClock> clock
    ) : httpClient_(std::move(httpClient))
      , settings_(std::move(settings))
      , clock_(std::move(clock))
    {
        std::cout << "[YahooQuoteProvider] Created, target: "
                  << settings_->getHost() << ":" << settings_->getPort() << std::endl;
    }

    domain::Quote fetchQuote(const std::string& symbol) override {
        SimpleRequest request(
            "GET",
            "/v8/finance/chart/" + utils::urlEncode(symbol),
            "",
            settings_->getHost(),
            settings_->getPort(),
            {{"User-Agent", settings_->getUserAgent()}, {"Accept", "application/json"}}
        );

        SimpleResponse response;
        try {
            if (!httpClient_->send(request, response)) {
                throw domain::FetchError::unreachable("Request to " + settings_->getHost() + " failed");
            }
        } catch (const domain::FetchError&) {
            throw;
        } catch (const std::exception& e) {
            throw domain::FetchError::unreachable(e.what());
        }

        if (response.getStatus() < 200 || response.getStatus() >= 300) {
            throw domain::FetchError::httpError(response.getStatus());
        }

        return parseQuote(response.getBody(), symbol, clock_->nowSeconds());
    }

    /**
     * @brief Разобрать тело chart API
     * @throws domain::FetchError (MalformedPayload, MissingField)
     */
    static domain::Quote parseQuote(const std::string& body, const std::string& symbol,
                                    std::int64_t timestamp) {
        nlohmann::json json = nlohmann::json::parse(body, nullptr, false);
        if (json.is_discarded()) {
            throw domain::FetchError::malformed("Invalid JSON in response");
        }

        const nlohmann::json* result = nullptr;
        if (json.is_object() && json.contains("chart") && json["chart"].is_object()) {
            const auto& chart = json["chart"];
            if (chart.contains("result") && chart["result"].is_array() &&
                !chart["result"].empty() && chart["result"][0].is_object()) {
                result = &chart["result"][0];
            }
        }
        if (result == nullptr) {
            throw domain::FetchError::malformed("Invalid response format");
        }

        if (!result->contains("meta") || !(*result)["meta"].is_object()) {
            throw domain::FetchError::malformed("Missing meta data");
        }
        const auto& meta = (*result)["meta"];

        auto price = numberField(meta, "regularMarketPrice");
        if (!price) {
            throw domain::FetchError::missingField("Missing price data");
        }

        std::string currency = "USD";
        if (meta.contains("currency") && meta["currency"].is_string()) {
            currency = meta["currency"].get<std::string>();
        }

        return domain::Quote(
            symbol,
            *price,
            currency,
            timestamp,
            SOURCE,
            numberField(meta, "regularMarketChange"),
            numberField(meta, "regularMarketChangePercent")
        );
    }

private:
    std::shared_ptr<IHttpClient> httpClient_;
    std::shared_ptr<settings::IYahooClientSettings> settings_;
    std::shared_ptr<ports::output::IClock> clock_;

    static std::optional<double> numberField(const nlohmann::json& obj, const char* name) {
        auto it = obj.find(name);
        if (it == obj.end() || !it->is_number()) {
            return std::nullopt;
        }
        return it->get<double>();
    }
};

} // namespace pricefetcher::adapters::secondary
