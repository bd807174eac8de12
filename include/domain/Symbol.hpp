#pragma once

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>
#include <vector>

namespace pricefetcher::domain {

/**
 * @brief Нормализовать тикер: обрезать пробелы, перевести в верхний регистр
 */
inline std::string normalizeSymbol(const std::string& raw) {
    auto begin = std::find_if_not(raw.begin(), raw.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(raw.rbegin(), raw.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    if (begin >= end) {
        return "";
    }

    std::string result(begin, end);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

/**
 * @brief Разбить "aapl, tsla,,MSFT" на нормализованные тикеры
 *
 * Пустые элементы пропускаются: {"AAPL", "TSLA", "MSFT"}
 */
inline std::vector<std::string> splitSymbols(const std::string& csv) {
    std::vector<std::string> symbols;
    std::stringstream ss(csv);
    std::string item;

    while (std::getline(ss, item, ',')) {
        auto symbol = normalizeSymbol(item);
        if (!symbol.empty()) {
            symbols.push_back(symbol);
        }
    }

    return symbols;
}

} // namespace pricefetcher::domain
