/**
 * Market service: owns all state and exposes the query and mutation operations
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "pricewatch/analytics/calculator.h"
#include "pricewatch/cache/holdings_cache.h"
#include "pricewatch/cache/quote_cache.h"
#include "pricewatch/cache/refresh_coordinator.h"
#include "pricewatch/cache/time_series_buffer.h"
#include "pricewatch/common/clock.h"
#include "pricewatch/common/config.h"
#include "pricewatch/common/worker_pool.h"
#include "pricewatch/data/failover_fetcher.h"
#include "pricewatch/data/fetch_adapters.h"
#include "pricewatch/data/http_client.h"
#include "pricewatch/data/portfolio_client.h"
#include "pricewatch/data/records.h"
#include "pricewatch/data/source_registry.h"
#include "pricewatch/persistence/state_store.h"
#include "pricewatch/service/background_poller.h"

namespace pricewatch {
namespace service {

// Data or an error message; no protocol concerns
template <typename T>
struct ServiceResult {
    bool success = false;
    std::string message;
    T data{};

    static ServiceResult ok(T value, std::string msg = "") {
        ServiceResult result;
        result.success = true;
        result.message = std::move(msg);
        result.data = std::move(value);
        return result;
    }

    static ServiceResult fail(std::string msg) {
        ServiceResult result;
        result.message = std::move(msg);
        return result;
    }
};

using ServiceStatus = ServiceResult<bool>;

// Latest price plus statistics over the buffered series
struct PriceSnapshot {
    data::Quote quote;
    std::optional<analytics::HistorySummary> summary;
};

struct ProfitCalculation {
    std::vector<analytics::TargetPrice> targets;
    double current_profit = 0.0;
};

// Everything the service talks to outside the process
struct Providers {
    std::shared_ptr<common::Clock> clock;
    std::shared_ptr<data::HttpClient> http;   // Kept alive for the adapters
    data::AdapterMap gold_adapters;
    data::AdapterMap fund_adapters;
    std::shared_ptr<data::PortfolioSource> portfolio_source;
    std::shared_ptr<persistence::StateStore> store;
};

// libcurl adapters, system clock and the configured JSON state file
Providers makeDefaultProviders(const common::Config& config);

// Exactly six ASCII digits
bool isValidFundCode(const std::string& code);

/**
 * Owns the registries, caches, history buffer and user records; all of
 * them share one recursive state mutex. Network calls and file I/O run
 * outside that mutex.
 */
class MarketService {
public:
    MarketService(const common::Config& config, Providers providers);
    ~MarketService();

    MarketService(const MarketService&) = delete;
    MarketService& operator=(const MarketService&) = delete;

    // Gold price
    ServiceResult<PriceSnapshot> getPrice();
    std::vector<data::Quote> getHistory() const;
    ServiceResult<ProfitCalculation> calculate(double buy_price, double current_price) const;

    // Fund watchlist
    ServiceResult<std::vector<data::Quote>> getFunds(bool fast_mode);
    ServiceResult<data::Quote> addFund(const std::string& code);
    ServiceStatus removeFund(const std::string& code);
    std::vector<std::string> getWatchlist() const;
    ServiceResult<data::FundPortfolio> getFundPortfolio(const std::string& code, bool force_refresh);

    // Holdings
    ServiceResult<data::HoldingsResponse> getHoldings(bool fast_mode, bool force_refresh);
    std::vector<data::Holding> getHoldingList() const;
    ServiceStatus upsertHolding(const std::string& code, double cost_price, double shares,
                                const std::string& note);
    ServiceStatus deleteHolding(const std::string& code);

    // Manual records and alerts
    ServiceResult<data::ManualRecord> addRecord(double price, double buy_price, double profit,
                                                const std::string& note);
    std::vector<data::ManualRecord> getRecords() const;
    ServiceStatus clearRecords();
    data::AlertSettings getAlertSettings() const;
    ServiceResult<data::AlertSettings> updateAlertSettings(const data::AlertSettings& settings);

    // Persistence; failures are logged and reported as false
    bool loadState();
    bool saveState();

    // Poller (when enabled) and background refresh threads
    void startBackground();
    void stopBackground();

    // Introspection
    std::vector<data::SourceDescriptor> goldSources() const { return gold_registry_.getSources(); }
    std::vector<data::SourceDescriptor> fundSources() const { return fund_registry_.getSources(); }
    size_t historySize() const { return history_.size(); }
    const BackgroundPoller& poller() const { return *poller_; }
    cache::RefreshCoordinator& refreshCoordinator() { return coordinator_; }

private:
    // Drop prior-day history and expired records; caller holds mutex_
    void pruneExpiredLocked(double now);

    common::CacheConfig cache_config_;
    common::HistoryConfig history_config_;
    common::PollerConfig poller_config_;

    // Providers
    std::shared_ptr<common::Clock> clock_;
    std::shared_ptr<data::HttpClient> http_;
    std::shared_ptr<data::PortfolioSource> portfolio_source_;
    std::shared_ptr<persistence::StateStore> store_;

    // Shared state lock, and the lock serializing snapshot writes
    mutable std::recursive_mutex mutex_;
    std::mutex save_mutex_;

    data::SourceRegistry gold_registry_;
    data::SourceRegistry fund_registry_;
    data::FailoverFetcher gold_fetcher_;
    data::FailoverFetcher fund_fetcher_;

    common::WorkerPool pool_;
    cache::RefreshCoordinator coordinator_;
    cache::QuoteCache fund_cache_;
    cache::HoldingsCache holdings_cache_;
    cache::TimeSeriesBuffer history_;
    std::unique_ptr<BackgroundPoller> poller_;

    // User state
    std::vector<std::string> watchlist_;
    std::vector<data::Holding> holdings_;
    std::vector<data::ManualRecord> manual_records_;
    data::AlertSettings alert_settings_;
    std::map<std::string, data::FundPortfolio> portfolios_;
};

} // namespace service
} // namespace pricewatch
