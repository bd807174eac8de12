#pragma once

#include "domain/BatchResult.hpp"
#include "domain/enums/ProviderName.hpp"
#include <string>
#include <vector>

namespace pricefetcher::ports::input {

/**
 * @brief Пакетное получение котировок
 */
class IPriceAggregator {
public:
    virtual ~IPriceAggregator() = default;

    /**
     * @brief Получить котировки по списку тикеров
     *
     * Ошибка одного тикера не прерывает остальные.
     *
     * @throws domain::AllPricesFailedError если не получен ни один тикер
     */
    virtual domain::BatchResult fetchBatch(const std::vector<std::string>& symbols,
                                           domain::ProviderName provider) = 0;
};

} // namespace pricefetcher::ports::input
