/**
 * User-owned records: holdings, manual snapshots, alerts, fund portfolios
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "pricewatch/data/quote.h"

namespace pricewatch {
namespace data {

// A fund position entered by the user
struct Holding {
    std::string code;
    std::string name;
    double cost_price = 0.0;
    double shares = 0.0;
    std::string note;
};

// Holding joined with its latest quote
struct HoldingView {
    Holding holding;
    bool has_quote = false;
    Quote quote;
    double cost = 0.0;
    double market_value = 0.0;
    double profit = 0.0;
    double profit_rate = 0.0;
    double daily_profit = 0.0;
};

struct HoldingsSummary {
    double total_cost = 0.0;
    double total_value = 0.0;
    double total_profit = 0.0;
    double total_profit_rate = 0.0;
    double total_daily_profit = 0.0;
    size_t count = 0;
};

// Memoized aggregate served by the holdings cache
struct HoldingsResponse {
    std::vector<HoldingView> items;
    HoldingsSummary summary;
    std::string last_update;
    bool stale = false;
};

// Price snapshot recorded by hand
struct ManualRecord {
    double price = 0.0;
    double buy_price = 0.0;
    double profit = 0.0;
    double timestamp = 0.0;
    std::string time_str;
    std::string note;
};

struct AlertSettings {
    double high = 0.0;
    double low = 0.0;
    bool enabled = false;
    bool trading_events_enabled = true;
};

// One stock position of a fund's disclosed portfolio
struct StockPosition {
    std::string code;
    std::string name;
    double weight = 0.0;       // Percent of net assets
};

struct FundPortfolio {
    std::string code;
    std::string report_period;
    double fetched_at = 0.0;
    std::vector<StockPosition> positions;
};

} // namespace data
} // namespace pricewatch
