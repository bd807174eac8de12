#pragma once

#include <cstdint>

namespace pricefetcher::ports::output {

/**
 * @brief Источник текущего времени (unix seconds)
 *
 * Подменяется в тестах, чтобы синтетические цены были детерминированы.
 */
class IClock {
public:
    virtual ~IClock() = default;

    virtual std::int64_t nowSeconds() const = 0;
};

} // namespace pricefetcher::ports::output
