#pragma once

#include <cstddef>

namespace pricefetcher::settings {

class IAggregatorSettings {
public:
    virtual ~IAggregatorSettings() = default;

    /// Сколько тикеров batch-запроса запрашиваются одновременно
    virtual std::size_t getConcurrency() const = 0;
};

} // namespace pricefetcher::settings
