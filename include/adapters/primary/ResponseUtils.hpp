#pragma once

#include "domain/Quote.hpp"
#include "domain/enums/ProviderName.hpp"
#include "utils/UrlCodec.hpp"

#include <IRequest.hpp>
#include <IResponse.hpp>
#include <nlohmann/json.hpp>
#include <iostream>
#include <string>

namespace pricefetcher::adapters::primary
{

    /// Провайдер, если ?source= не указан
    inline constexpr const char *DEFAULT_SOURCE = "yahoo";

    /**
     * @brief Провайдер из ?source=
     *
     * Неизвестное имя не отклоняется: пишем warning и используем mock.
     */
    inline domain::ProviderName resolveProvider(IRequest &req)
    {
        auto source = utils::urlDecode(req.getQueryParam("source").value_or(DEFAULT_SOURCE), true);
        if (source.empty())
        {
            source = DEFAULT_SOURCE;
        }

        auto provider = domain::parseProviderName(source);
        if (!provider)
        {
            std::cerr << "[ResponseUtils] Unknown source: " << source << ", falling back to mock" << std::endl;
            return domain::ProviderName::MOCK;
        }
        return *provider;
    }

    /**
     * @brief Quote -> JSON объекта ответа
     *
     * change_24h и change_percent_24h всегда присутствуют, null если неизвестны.
     */
    inline nlohmann::json quoteToJson(const domain::Quote &quote)
    {
        nlohmann::json q;
        q["symbol"] = quote.symbol;
        q["price"] = quote.price;
        q["currency"] = quote.currency;
        q["timestamp"] = quote.timestamp;
        q["source"] = quote.source;
        q["change_24h"] = quote.change24h ? nlohmann::json(*quote.change24h) : nlohmann::json(nullptr);
        q["change_percent_24h"] = quote.changePercent24h ? nlohmann::json(*quote.changePercent24h)
                                                         : nlohmann::json(nullptr);
        return q;
    }

    inline void sendJson(IResponse &res, int status, const nlohmann::json &body)
    {
        res.setResult(status, "application/json", body.dump());
    }

    inline void sendError(IResponse &res, int status, const std::string &code, const std::string &message)
    {
        nlohmann::json error;
        error["error"] = code;
        error["message"] = message;
        sendJson(res, status, error);
    }

} // namespace pricefetcher::adapters::primary
