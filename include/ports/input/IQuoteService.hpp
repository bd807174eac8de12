#pragma once

#include "domain/Quote.hpp"
#include "domain/enums/ProviderName.hpp"
#include <string>

namespace pricefetcher::ports::input {

/**
 * @brief Получение котировки одного тикера у выбранного провайдера
 */
class IQuoteService {
public:
    virtual ~IQuoteService() = default;

    /**
     * @brief Получить котировку
     *
     * @param symbol Нормализованный тикер (AAPL)
     * @param provider Провайдер
     * @throws domain::FetchError если провайдер не смог отдать цену
     */
    virtual domain::Quote fetch(const std::string& symbol, domain::ProviderName provider) = 0;
};

} // namespace pricefetcher::ports::input
