/**
 * Calculator implementation
 */

#include <algorithm>

#include "pricewatch/analytics/calculator.h"
#include "pricewatch/common/clock.h"

namespace pricewatch {
namespace analytics {

namespace {

const int PROFIT_TARGETS[] = {5, 10, 15, 20, 30};

} // namespace

std::vector<TargetPrice> calculateTargetPrices(double buy_price, double fee_rate) {
    std::vector<TargetPrice> targets;
    if (buy_price <= 0.0) {
        return targets;
    }

    for (int percent : PROFIT_TARGETS) {
        double rate = percent / 100.0;
        double sell_price = buy_price * (1.0 + rate) / (1.0 - fee_rate);

        TargetPrice target;
        target.target_percent = percent;
        target.sell_price = data::roundTo(sell_price, 2);
        target.profit_amount = data::roundTo(buy_price * rate, 2);
        target.actual_multiplier = data::roundTo(sell_price / buy_price, 4);
        targets.push_back(target);
    }
    return targets;
}

double calculateCurrentProfit(double buy_price, double current_price, double fee_rate) {
    if (buy_price <= 0.0) {
        return 0.0;
    }
    double received = current_price * (1.0 - fee_rate);
    return data::roundTo((received - buy_price) / buy_price * 100.0, 2);
}

std::optional<HistorySummary> summarizeHistory(const std::vector<data::Quote>& points) {
    if (points.empty()) {
        return std::nullopt;
    }

    double high = points.front().price;
    double low = points.front().price;
    double sum = 0.0;
    for (const auto& point : points) {
        high = std::max(high, point.price);
        low = std::min(low, point.price);
        sum += point.price;
    }

    HistorySummary summary;
    summary.high = data::roundTo(high, 2);
    summary.low = data::roundTo(low, 2);
    summary.avg = data::roundTo(sum / static_cast<double>(points.size()), 2);
    summary.volatility = data::roundTo(high - low, 2);
    summary.count = points.size();
    return summary;
}

data::HoldingsResponse buildHoldingsResponse(const std::vector<data::Holding>& holdings,
                                             const std::map<std::string, data::Quote>& fresh_quotes,
                                             const std::map<std::string, data::Quote>& cached_quotes,
                                             double now) {
    data::HoldingsResponse response;
    data::HoldingsSummary& summary = response.summary;

    for (const auto& holding : holdings) {
        data::HoldingView view;
        view.holding = holding;
        view.cost = holding.cost_price * holding.shares;

        auto fresh = fresh_quotes.find(holding.code);
        auto cached = cached_quotes.find(holding.code);
        if (fresh != fresh_quotes.end() && fresh->second.isValid()) {
            view.quote = fresh->second;
            view.has_quote = true;
        } else if (cached != cached_quotes.end() && cached->second.isValid()) {
            view.quote = cached->second;
            data::annotateSource(view.quote, data::EXPIRED_MARKER);
            view.has_quote = true;
        }

        if (view.has_quote) {
            view.market_value = view.quote.price * holding.shares;
            view.daily_profit = view.quote.change * holding.shares;
        } else {
            view.market_value = view.cost;
        }
        view.profit = view.market_value - view.cost;
        view.profit_rate = view.cost > 0.0 ? view.profit / view.cost * 100.0 : 0.0;

        summary.total_cost += view.cost;
        summary.total_value += view.market_value;
        summary.total_profit += view.profit;
        summary.total_daily_profit += view.daily_profit;

        view.cost = data::roundTo(view.cost, 2);
        view.market_value = data::roundTo(view.market_value, 2);
        view.profit = data::roundTo(view.profit, 2);
        view.profit_rate = data::roundTo(view.profit_rate, 2);
        view.daily_profit = data::roundTo(view.daily_profit, 2);
        response.items.push_back(view);
    }

    summary.total_profit_rate = summary.total_cost > 0.0
        ? summary.total_profit / summary.total_cost * 100.0
        : 0.0;
    summary.total_cost = data::roundTo(summary.total_cost, 2);
    summary.total_value = data::roundTo(summary.total_value, 2);
    summary.total_profit = data::roundTo(summary.total_profit, 2);
    summary.total_profit_rate = data::roundTo(summary.total_profit_rate, 2);
    summary.total_daily_profit = data::roundTo(summary.total_daily_profit, 2);
    summary.count = holdings.size();

    response.last_update = common::formatLocalTime(now, "%Y-%m-%d %H:%M:%S");
    response.stale = false;
    return response;
}

} // namespace analytics
} // namespace pricewatch
