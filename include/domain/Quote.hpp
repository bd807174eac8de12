#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace pricefetcher::domain {

/**
 * @brief Нормализованная котировка тикера
 *
 * Значение создаётся провайдером в момент запроса и сразу
 * сериализуется в ответ. Нигде не хранится.
 */
class Quote {
public:
    std::string symbol;                         ///< Тикер в верхнем регистре
    double price = 0.0;                         ///< Цена в единицах валюты
    std::string currency = "USD";               ///< Код валюты (3 символа)
    std::int64_t timestamp = 0;                 ///< Unix seconds, момент получения
    std::string source;                         ///< Идентификатор провайдера
    std::optional<double> change24h;            ///< Изменение за 24ч
    std::optional<double> changePercent24h;     ///< Изменение за 24ч, %

    Quote() = default;

    Quote(std::string s, double p, std::string cur, std::int64_t ts, std::string src,
          std::optional<double> change = std::nullopt,
          std::optional<double> changePercent = std::nullopt)
        : symbol(std::move(s))
        , price(p)
        , currency(std::move(cur))
        , timestamp(ts)
        , source(std::move(src))
        , change24h(change)
        , changePercent24h(changePercent)
    {}
};

} // namespace pricefetcher::domain
