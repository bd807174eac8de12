#pragma once

#include "domain/StockGroup.hpp"
#include <vector>

namespace pricefetcher::ports::input {

/**
 * @brief Каталог тематических групп тикеров
 */
class IStockGroupService {
public:
    virtual ~IStockGroupService() = default;

    virtual std::vector<domain::StockGroup> getGroups() const = 0;
};

} // namespace pricefetcher::ports::input
