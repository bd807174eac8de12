#pragma once

#include <string>
#include <vector>

namespace pricefetcher::domain {

/**
 * @brief Тематическая группа тикеров (tech, finance, ...)
 */
struct StockGroup {
    std::string id;
    std::string name;
    std::vector<std::string> symbols;
    std::string description;
};

} // namespace pricefetcher::domain
