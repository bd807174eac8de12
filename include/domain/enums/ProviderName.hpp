#pragma once

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>

namespace pricefetcher::domain {

/**
 * @brief Закрытый набор провайдеров котировок
 *
 * Внешние имена (query ?source=): yahoo, alpha_vantage, mock.
 */
enum class ProviderName {
    YAHOO,
    ALPHA_VANTAGE,
    MOCK
};

inline std::string toString(ProviderName provider) {
    switch (provider) {
        case ProviderName::YAHOO: return "yahoo";
        case ProviderName::ALPHA_VANTAGE: return "alpha_vantage";
        case ProviderName::MOCK: return "mock";
    }
    return "mock";
}

/**
 * @brief Разобрать внешнее имя провайдера (регистр не важен)
 * @return nullopt для неизвестного имени
 */
inline std::optional<ProviderName> parseProviderName(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "yahoo") return ProviderName::YAHOO;
    if (lower == "alpha_vantage") return ProviderName::ALPHA_VANTAGE;
    if (lower == "mock") return ProviderName::MOCK;
    return std::nullopt;
}

} // namespace pricefetcher::domain
