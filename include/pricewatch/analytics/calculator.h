/**
 * Profit targets, history statistics and holdings valuation
 */

#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "pricewatch/data/quote.h"
#include "pricewatch/data/records.h"

namespace pricewatch {
namespace analytics {

// Default sell-side fee
constexpr double DEFAULT_FEE_RATE = 0.005;

struct TargetPrice {
    int target_percent = 0;
    double sell_price = 0.0;
    double profit_amount = 0.0;
    double actual_multiplier = 0.0;
};

struct HistorySummary {
    double high = 0.0;
    double low = 0.0;
    double avg = 0.0;
    double volatility = 0.0;   // high - low
    size_t count = 0;
};

/**
 * Sell prices reaching 5/10/15/20/30 % profit after the fee:
 * sell = buy * (1 + p) / (1 - fee). Empty for a non-positive buy price.
 */
std::vector<TargetPrice> calculateTargetPrices(double buy_price, double fee_rate = DEFAULT_FEE_RATE);

// Percent return of selling at current_price after the fee, 0 when buy_price <= 0
double calculateCurrentProfit(double buy_price, double current_price, double fee_rate = DEFAULT_FEE_RATE);

// nullopt for an empty series
std::optional<HistorySummary> summarizeHistory(const std::vector<data::Quote>& points);

/**
 * Value each holding with its fresh quote, falling back to the cached one.
 * Holdings with neither are reported at cost with has_quote = false.
 */
data::HoldingsResponse buildHoldingsResponse(const std::vector<data::Holding>& holdings,
                                             const std::map<std::string, data::Quote>& fresh_quotes,
                                             const std::map<std::string, data::Quote>& cached_quotes,
                                             double now);

} // namespace analytics
} // namespace pricewatch
