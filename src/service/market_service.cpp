/**
 * Market service implementation
 */

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "pricewatch/common/logging.h"
#include "pricewatch/service/market_service.h"

namespace pricewatch {
namespace service {

namespace {

constexpr double SECONDS_PER_DAY = 86400.0;

template <typename T>
std::shared_ptr<T> required(std::shared_ptr<T> ptr, const char* what) {
    if (!ptr) {
        throw std::invalid_argument(std::string("MarketService requires a ") + what);
    }
    return ptr;
}

cache::CacheTtl makeTtl(int fresh_s, int stale_s) {
    cache::CacheTtl ttl;
    ttl.fresh_s = static_cast<double>(fresh_s);
    ttl.stale_s = static_cast<double>(stale_s);
    return ttl;
}

} // namespace

Providers makeDefaultProviders(const common::Config& config) {
    Providers providers;
    providers.clock = std::make_shared<common::SystemClock>();
    providers.http = std::make_shared<data::CurlHttpClient>(config);
    providers.gold_adapters = data::makeGoldAdapters(*providers.http, *providers.clock);
    providers.fund_adapters = data::makeFundAdapters(*providers.http, *providers.clock);
    providers.portfolio_source =
        std::make_shared<data::EastmoneyPortfolioClient>(*providers.http, *providers.clock);
    providers.store = std::make_shared<persistence::JsonFileStore>(config.getStorageConfig().data_file);
    return providers;
}

bool isValidFundCode(const std::string& code) {
    if (code.size() != 6) {
        return false;
    }
    return std::all_of(code.begin(), code.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

MarketService::MarketService(const common::Config& config, Providers providers)
    : cache_config_(config.getCacheConfig()),
      history_config_(config.getHistoryConfig()),
      poller_config_(config.getPollerConfig()),
      clock_(required(std::move(providers.clock), "clock")),
      http_(std::move(providers.http)),
      portfolio_source_(required(std::move(providers.portfolio_source), "portfolio source")),
      store_(required(std::move(providers.store), "state store")),
      gold_registry_(config.getSources(), config.getBreakerConfig(), *clock_, mutex_),
      fund_registry_(config.getFundSources(), config.getBreakerConfig(), *clock_, mutex_),
      gold_fetcher_(gold_registry_, std::move(providers.gold_adapters)),
      fund_fetcher_(fund_registry_, std::move(providers.fund_adapters)),
      pool_(static_cast<size_t>(config.getWorkerConfig().max_fetch_workers)),
      fund_cache_(fund_fetcher_, pool_, coordinator_, *clock_,
                  makeTtl(cache_config_.fund_fresh_ttl_s, cache_config_.fund_stale_ttl_s), mutex_),
      holdings_cache_(fund_cache_, coordinator_, *clock_,
                      makeTtl(cache_config_.holdings_fresh_ttl_s, cache_config_.holdings_stale_ttl_s), mutex_),
      history_(history_config_.capacity, mutex_) {
    poller_ = std::make_unique<BackgroundPoller>(gold_fetcher_, history_, poller_config_,
                                                 [this]() { saveState(); });

    LOG_INFO("Market service ready: " + std::to_string(config.getSources().size()) + " gold sources, " +
             std::to_string(config.getFundSources().size()) + " fund sources, " +
             std::to_string(pool_.size()) + " fetch workers");
}

MarketService::~MarketService() {
    stopBackground();
}

// Gold price

ServiceResult<PriceSnapshot> MarketService::getPrice() {
    std::optional<data::Quote> latest = history_.latest();
    double now = clock_->now();

    bool too_old = latest && (now - latest->timestamp > cache_config_.price_stale_threshold_s);
    if (!latest || too_old) {
        // Poller is behind or not running
        data::FetchResult result = gold_fetcher_.fetch();
        if (result.ok()) {
            history_.append(*result.quote);
            saveState();
            latest = result.quote;
        } else if (!latest) {
            return ServiceResult<PriceSnapshot>::fail(result.message());
        }
    }

    PriceSnapshot snapshot;
    snapshot.quote = *latest;
    snapshot.summary = analytics::summarizeHistory(history_.snapshot());
    return ServiceResult<PriceSnapshot>::ok(snapshot);
}

std::vector<data::Quote> MarketService::getHistory() const {
    return history_.snapshot();
}

ServiceResult<ProfitCalculation> MarketService::calculate(double buy_price, double current_price) const {
    if (!(buy_price > 0.0)) {
        return ServiceResult<ProfitCalculation>::fail("buy price must be positive");
    }

    ProfitCalculation calculation;
    calculation.targets = analytics::calculateTargetPrices(buy_price);
    calculation.current_profit = analytics::calculateCurrentProfit(buy_price, current_price);
    return ServiceResult<ProfitCalculation>::ok(calculation);
}

// Fund watchlist

ServiceResult<std::vector<data::Quote>> MarketService::getFunds(bool fast_mode) {
    std::vector<std::string> watchlist = getWatchlist();
    std::map<std::string, data::Quote> quotes = fund_cache_.getMany(watchlist, fast_mode);

    std::vector<data::Quote> ordered;
    ordered.reserve(watchlist.size());
    for (const auto& code : watchlist) {
        auto it = quotes.find(code);
        if (it != quotes.end()) {
            ordered.push_back(it->second);
        }
    }
    return ServiceResult<std::vector<data::Quote>>::ok(ordered);
}

ServiceResult<data::Quote> MarketService::addFund(const std::string& code) {
    if (!isValidFundCode(code)) {
        return ServiceResult<data::Quote>::fail("invalid fund code (6 digits required)");
    }

    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (std::find(watchlist_.begin(), watchlist_.end(), code) != watchlist_.end()) {
            return ServiceResult<data::Quote>::fail("fund " + code + " is already in the watchlist");
        }
    }

    // One fetch proves the code exists
    data::FetchResult result = fund_fetcher_.fetch(code);
    if (!result.ok()) {
        return ServiceResult<data::Quote>::fail("cannot fetch fund " + code + ": " + result.message());
    }

    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (std::find(watchlist_.begin(), watchlist_.end(), code) != watchlist_.end()) {
            return ServiceResult<data::Quote>::fail("fund " + code + " is already in the watchlist");
        }
        watchlist_.push_back(code);
        fund_cache_.put(code, *result.quote);
    }

    saveState();
    LOG_INFO("Added fund " + code + " to watchlist");
    return ServiceResult<data::Quote>::ok(*result.quote);
}

ServiceStatus MarketService::removeFund(const std::string& code) {
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        auto it = std::find(watchlist_.begin(), watchlist_.end(), code);
        if (it == watchlist_.end()) {
            return ServiceStatus::fail("fund " + code + " is not in the watchlist");
        }
        watchlist_.erase(it);
        fund_cache_.erase(code);
    }

    saveState();
    LOG_INFO("Removed fund " + code + " from watchlist");
    return ServiceStatus::ok(true);
}

std::vector<std::string> MarketService::getWatchlist() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return watchlist_;
}

ServiceResult<data::FundPortfolio> MarketService::getFundPortfolio(const std::string& code, bool force_refresh) {
    if (!isValidFundCode(code)) {
        return ServiceResult<data::FundPortfolio>::fail("invalid fund code (6 digits required)");
    }

    if (!force_refresh) {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        auto it = portfolios_.find(code);
        if (it != portfolios_.end() &&
            clock_->now() - it->second.fetched_at < cache_config_.portfolio_ttl_s) {
            return ServiceResult<data::FundPortfolio>::ok(it->second);
        }
    }

    std::optional<data::FundPortfolio> fetched = portfolio_source_->fetch(code);
    if (fetched) {
        {
            std::lock_guard<std::recursive_mutex> lock(mutex_);
            portfolios_[code] = *fetched;
        }
        saveState();
        return ServiceResult<data::FundPortfolio>::ok(*fetched);
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = portfolios_.find(code);
    if (it != portfolios_.end()) {
        return ServiceResult<data::FundPortfolio>::ok(it->second, "refresh failed, serving cached portfolio");
    }
    return ServiceResult<data::FundPortfolio>::fail("failed to fetch portfolio for fund " + code);
}

// Holdings

ServiceResult<data::HoldingsResponse> MarketService::getHoldings(bool fast_mode, bool force_refresh) {
    std::vector<data::Holding> holdings = getHoldingList();
    return ServiceResult<data::HoldingsResponse>::ok(holdings_cache_.get(holdings, fast_mode, force_refresh));
}

std::vector<data::Holding> MarketService::getHoldingList() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return holdings_;
}

ServiceStatus MarketService::upsertHolding(const std::string& code, double cost_price, double shares,
                                           const std::string& note) {
    if (!isValidFundCode(code)) {
        return ServiceStatus::fail("invalid fund code (6 digits required)");
    }
    if (!(cost_price > 0.0) || !(shares > 0.0)) {
        return ServiceStatus::fail("cost price and shares must be positive");
    }

    // Resolve the display name, from the cache when possible
    std::string name;
    std::optional<cache::CacheEntry> cached = fund_cache_.lookup(code);
    if (cached && !cached->quote.name.empty()) {
        name = cached->quote.name;
    } else {
        data::FetchResult result = fund_fetcher_.fetch(code);
        if (result.ok() && !result.quote->name.empty()) {
            name = result.quote->name;
            fund_cache_.put(code, *result.quote);
        } else {
            name = "Fund " + code;
        }
    }

    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        auto it = std::find_if(holdings_.begin(), holdings_.end(),
                               [&code](const data::Holding& h) { return h.code == code; });
        if (it != holdings_.end()) {
            it->name = name;
            it->cost_price = cost_price;
            it->shares = shares;
            it->note = note;
        } else {
            data::Holding holding;
            holding.code = code;
            holding.name = name;
            holding.cost_price = cost_price;
            holding.shares = shares;
            holding.note = note;
            holdings_.push_back(holding);
        }
        holdings_cache_.invalidate();
    }

    saveState();
    return ServiceStatus::ok(true, "holding saved");
}

ServiceStatus MarketService::deleteHolding(const std::string& code) {
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        auto it = std::remove_if(holdings_.begin(), holdings_.end(),
                                 [&code](const data::Holding& h) { return h.code == code; });
        if (it == holdings_.end()) {
            return ServiceStatus::fail("holding " + code + " not found");
        }
        holdings_.erase(it, holdings_.end());
        holdings_cache_.invalidate();
    }

    saveState();
    return ServiceStatus::ok(true, "holding deleted");
}

// Manual records and alerts

ServiceResult<data::ManualRecord> MarketService::addRecord(double price, double buy_price, double profit,
                                                           const std::string& note) {
    data::ManualRecord record;
    record.price = price;
    record.buy_price = buy_price;
    record.profit = profit;
    record.timestamp = clock_->now();
    record.time_str = common::formatLocalTime(record.timestamp, "%Y-%m-%d %H:%M:%S");
    record.note = note;

    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        manual_records_.push_back(record);
    }

    saveState();
    return ServiceResult<data::ManualRecord>::ok(record);
}

std::vector<data::ManualRecord> MarketService::getRecords() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return manual_records_;
}

ServiceStatus MarketService::clearRecords() {
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        manual_records_.clear();
    }
    saveState();
    return ServiceStatus::ok(true);
}

data::AlertSettings MarketService::getAlertSettings() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return alert_settings_;
}

ServiceResult<data::AlertSettings> MarketService::updateAlertSettings(const data::AlertSettings& settings) {
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        alert_settings_ = settings;
    }
    saveState();
    return ServiceResult<data::AlertSettings>::ok(settings);
}

// Persistence

bool MarketService::loadState() {
    std::optional<persistence::StateSnapshot> snapshot;
    try {
        snapshot = store_->load();
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Failed to load state, starting empty: ") + e.what());
        return false;
    }

    if (!snapshot) {
        LOG_INFO("No saved state, starting empty");
        return true;
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    manual_records_ = snapshot->manual_records;
    alert_settings_ = snapshot->alert_settings;
    watchlist_ = snapshot->fund_watchlist;
    holdings_ = snapshot->fund_holdings;
    portfolios_ = snapshot->fund_portfolios;
    history_.assign(snapshot->price_history);
    holdings_cache_.invalidate();

    // Prior-day points must not be visible before the first save
    pruneExpiredLocked(clock_->now());

    LOG_INFO("Loaded state: " + std::to_string(manual_records_.size()) + " records, " +
             std::to_string(history_.size()) + " history points, " +
             std::to_string(watchlist_.size()) + " watched funds, " +
             std::to_string(holdings_.size()) + " holdings, " +
             std::to_string(portfolios_.size()) + " cached portfolios");
    return true;
}

bool MarketService::saveState() {
    // Serializes writers so snapshots reach the file in order
    std::lock_guard<std::mutex> save_lock(save_mutex_);

    persistence::StateSnapshot snapshot;
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        pruneExpiredLocked(clock_->now());

        snapshot.manual_records = manual_records_;
        snapshot.price_history = history_.snapshot();
        snapshot.alert_settings = alert_settings_;
        snapshot.fund_watchlist = watchlist_;
        snapshot.fund_holdings = holdings_;
        snapshot.fund_portfolios = portfolios_;
    }

    try {
        store_->save(snapshot);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Failed to save state: ") + e.what());
        return false;
    }
}

void MarketService::pruneExpiredLocked(double now) {
    history_.pruneBefore(common::localDayStart(now));

    double threshold = now - history_config_.records_keep_days * SECONDS_PER_DAY;
    manual_records_.erase(std::remove_if(manual_records_.begin(), manual_records_.end(),
                                         [threshold](const data::ManualRecord& r) {
                                             return r.timestamp <= threshold;
                                         }),
                          manual_records_.end());
}

// Background work

void MarketService::startBackground() {
    if (!poller_config_.enabled) {
        LOG_INFO("Background poller disabled by configuration");
        return;
    }
    poller_->start();
}

void MarketService::stopBackground() {
    if (poller_) {
        poller_->stop();
    }
    coordinator_.shutdown();
}

} // namespace service
} // namespace pricewatch
