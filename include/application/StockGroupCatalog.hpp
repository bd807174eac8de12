#pragma once

#include "ports/input/IStockGroupService.hpp"

namespace pricefetcher::application {

/**
 * @brief Статический каталог популярных групп тикеров
 */
class StockGroupCatalog : public ports::input::IStockGroupService {
public:
    std::vector<domain::StockGroup> getGroups() const override {
        return {
            {"tech", "Tech Giants",
             {"AAPL", "MSFT", "GOOGL", "META", "NVDA", "NFLX", "AMZN", "TSLA"},
             "Major technology companies"},
            {"finance", "Financial Sector",
             {"JPM", "BAC", "WFC", "GS", "MS", "C", "AXP", "V"},
             "Banking and financial services"},
            {"healthcare", "Healthcare",
             {"JNJ", "PFE", "UNH", "ABBV", "MRK", "TMO", "ABT", "LLY"},
             "Pharmaceutical and healthcare companies"},
            {"energy", "Energy Sector",
             {"XOM", "CVX", "COP", "EOG", "SLB", "KMI", "PSX", "VLO"},
             "Oil, gas, and energy companies"},
            {"retail", "Retail & Consumer",
             {"WMT", "TGT", "COST", "HD", "LOW", "NKE", "SBUX", "MCD"},
             "Retail and consumer goods"},
            {"crypto", "Crypto-Related",
             {"COIN", "MSTR", "RIOT", "MARA", "HUT", "BITF", "CAN", "HIVE"},
             "Cryptocurrency and blockchain companies"}
        };
    }
};

} // namespace pricefetcher::application
