#pragma once

#include "ports/output/IClock.hpp"
#include <chrono>

namespace pricefetcher::adapters::secondary {

class SystemClock : public ports::output::IClock {
public:
    std::int64_t nowSeconds() const override {
        return std::chrono::duration_cast<std::chrono::seconds>(
                   std::chrono::system_clock::now().time_since_epoch())
            .count();
    }
};

} // namespace pricefetcher::adapters::secondary
