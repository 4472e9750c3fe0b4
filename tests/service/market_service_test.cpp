/**
 * Market service tests against scripted providers
 */

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <thread>
#include <gtest/gtest.h>

#include "fixtures/manual_clock.h"
#include "fixtures/memory_state_store.h"
#include "fixtures/scripted_adapter.h"
#include "pricewatch/service/market_service.h"

using namespace pricewatch;

namespace {

constexpr double SECONDS_PER_DAY = 86400.0;

std::string testConfig(bool poller_enabled = false) {
    std::string yaml = R"(
sources:
  - name: Gold
    type: gold_scripted
fund_sources:
  - name: Funds
    type: fund_scripted
breaker:
  max_fail_count: 1000
workers:
  max_fetch_workers: 2
)";
    yaml += poller_enabled ? "poller:\n  enabled: true\n  interval_ms: 5\n" : "poller:\n  enabled: false\n";
    return yaml;
}

class FakePortfolioSource : public data::PortfolioSource {
public:
    std::optional<data::FundPortfolio> fetch(const std::string& code) override {
        calls_++;
        std::lock_guard<std::mutex> lock(mutex_);
        if (!available_) {
            return std::nullopt;
        }
        data::FundPortfolio portfolio;
        portfolio.code = code;
        portfolio.report_period = "2024-06-30";
        portfolio.fetched_at = fetched_at_;
        portfolio.positions.push_back({"600519", "Kweichow Moutai", 15.12});
        return portfolio;
    }

    void setAvailable(bool available, double fetched_at = 0.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        available_ = available;
        fetched_at_ = fetched_at;
    }

    int calls() const { return calls_.load(); }

private:
    std::mutex mutex_;
    bool available_ = false;
    double fetched_at_ = 0.0;
    std::atomic<int> calls_{0};
};

class MarketServiceTest : public ::testing::Test {
protected:
    MarketServiceTest()
        : clock_(std::make_shared<fixtures::ManualClock>(1704700000.0)),
          gold_(std::make_shared<fixtures::ScriptedAdapter>()),
          funds_(std::make_shared<fixtures::ScriptedAdapter>()),
          portfolio_(std::make_shared<FakePortfolioSource>()),
          store_(std::make_shared<fixtures::MemoryStateStore>()) {
    }

    std::unique_ptr<service::MarketService> makeService(bool poller_enabled = false) {
        service::Providers providers;
        providers.clock = clock_;
        providers.gold_adapters["gold_scripted"] = gold_;
        providers.fund_adapters["fund_scripted"] = funds_;
        providers.portfolio_source = portfolio_;
        providers.store = store_;
        return std::make_unique<service::MarketService>(common::Config::fromString(testConfig(poller_enabled)),
                                                        providers);
    }

    // Fund quotes named after the fund, stamped with the test clock
    void fundsSucceed(double price) {
        auto clock = clock_;
        funds_->setHandler([clock, price](const data::SourceDescriptor& source, const std::string& key) {
            data::Quote quote = fixtures::makeQuote(price, source.name, clock->now(), key);
            quote.name = "Index Fund " + key;
            quote.change = 0.01;
            return std::optional<data::Quote>(quote);
        });
    }

    std::shared_ptr<fixtures::ManualClock> clock_;
    std::shared_ptr<fixtures::ScriptedAdapter> gold_;
    std::shared_ptr<fixtures::ScriptedAdapter> funds_;
    std::shared_ptr<FakePortfolioSource> portfolio_;
    std::shared_ptr<fixtures::MemoryStateStore> store_;
};

} // namespace

TEST(FundCodeTest, ExactlySixDigits) {
    EXPECT_TRUE(service::isValidFundCode("161725"));
    EXPECT_FALSE(service::isValidFundCode("16172"));
    EXPECT_FALSE(service::isValidFundCode("1617250"));
    EXPECT_FALSE(service::isValidFundCode("16172a"));
    EXPECT_FALSE(service::isValidFundCode(""));
}

TEST_F(MarketServiceTest, MissingProvidersRejected) {
    service::Providers providers;
    providers.clock = clock_;
    providers.portfolio_source = portfolio_;
    EXPECT_THROW(service::MarketService(common::Config::fromString(testConfig()), providers),
                 std::invalid_argument);
}

// Gold price

TEST_F(MarketServiceTest, PriceFetchedWhenHistoryEmpty) {
    gold_->succeedWith(552.3, clock_.get());
    auto market = makeService();

    auto result = market->getPrice();
    ASSERT_TRUE(result.success);
    EXPECT_DOUBLE_EQ(result.data.quote.price, 552.3);
    EXPECT_EQ(result.data.quote.source, "Gold");
    ASSERT_TRUE(result.data.summary.has_value());
    EXPECT_EQ(result.data.summary->count, 1u);
    EXPECT_EQ(market->historySize(), 1u);
    EXPECT_GE(store_->saveCount(), 1);
}

TEST_F(MarketServiceTest, RecentPointServedWithoutFetching) {
    gold_->succeedWith(552.3, clock_.get());
    auto market = makeService();
    market->getPrice();

    clock_->advance(10.0);
    market->getPrice();
    EXPECT_EQ(gold_->calls(), 1);

    // Older than the stale threshold: fetch again
    clock_->advance(40.0);
    gold_->succeedWith(553.0, clock_.get());
    auto result = market->getPrice();
    EXPECT_EQ(gold_->calls(), 2);
    EXPECT_DOUBLE_EQ(result.data.quote.price, 553.0);
    EXPECT_EQ(market->getHistory().size(), 2u);
}

TEST_F(MarketServiceTest, PriceErrorWhenNothingKnown) {
    gold_->fail();
    auto market = makeService();

    auto result = market->getPrice();
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "all sources failed");
}

TEST_F(MarketServiceTest, OldPriceServedWhenRefetchFails) {
    gold_->succeedWith(552.3, clock_.get());
    auto market = makeService();
    market->getPrice();

    gold_->fail();
    clock_->advance(60.0);
    auto result = market->getPrice();
    ASSERT_TRUE(result.success);
    EXPECT_DOUBLE_EQ(result.data.quote.price, 552.3);
}

TEST_F(MarketServiceTest, CalculateRequiresPositiveBuyPrice) {
    auto market = makeService();

    auto rejected = market->calculate(0.0, 550.0);
    EXPECT_FALSE(rejected.success);
    EXPECT_EQ(rejected.message, "buy price must be positive");

    auto result = market->calculate(500.0, 550.0);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.data.targets.size(), 5u);
    EXPECT_DOUBLE_EQ(result.data.current_profit, 9.45);
}

// Fund watchlist

TEST_F(MarketServiceTest, AddFundValidatesAndFetches) {
    fundsSucceed(1.2345);
    auto market = makeService();

    EXPECT_FALSE(market->addFund("16172").success);
    EXPECT_EQ(funds_->calls(), 0);

    auto added = market->addFund("161725");
    ASSERT_TRUE(added.success);
    EXPECT_DOUBLE_EQ(added.data.price, 1.2345);
    EXPECT_EQ(market->getWatchlist(), (std::vector<std::string>{"161725"}));

    auto duplicate = market->addFund("161725");
    EXPECT_FALSE(duplicate.success);
    EXPECT_NE(duplicate.message.find("already"), std::string::npos);

    ASSERT_TRUE(store_->saved().has_value());
    EXPECT_EQ(store_->saved()->fund_watchlist.size(), 1u);
}

TEST_F(MarketServiceTest, AddFundFailsWhenUnfetchable) {
    funds_->fail();
    auto market = makeService();

    auto result = market->addFund("999999");
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.message.find("all sources failed"), std::string::npos);
    EXPECT_TRUE(market->getWatchlist().empty());
}

TEST_F(MarketServiceTest, FundsFollowWatchlistOrder) {
    fundsSucceed(1.5);
    auto market = makeService();
    market->addFund("161725");
    market->addFund("000001");

    auto cached = market->getFunds(false);
    ASSERT_TRUE(cached.success);
    ASSERT_EQ(cached.data.size(), 2u);
    EXPECT_EQ(cached.data[0].code, "161725");
    EXPECT_EQ(cached.data[1].code, "000001");
    EXPECT_EQ(funds_->calls(), 2);

    // Expired entries with failing sources degrade to marked cache values
    funds_->fail();
    clock_->advance(200.0);
    auto degraded = market->getFunds(false);
    ASSERT_EQ(degraded.data.size(), 2u);
    EXPECT_NE(degraded.data[0].source.find(data::EXPIRED_MARKER), std::string::npos);
    EXPECT_DOUBLE_EQ(degraded.data[1].price, 1.5);
}

TEST_F(MarketServiceTest, RemoveFund) {
    fundsSucceed(1.5);
    auto market = makeService();
    market->addFund("161725");

    EXPECT_FALSE(market->removeFund("000001").success);
    EXPECT_TRUE(market->removeFund("161725").success);
    EXPECT_TRUE(market->getWatchlist().empty());
    EXPECT_TRUE(market->getFunds(false).data.empty());
}

// Portfolio

TEST_F(MarketServiceTest, PortfolioCachedWithinTtl) {
    portfolio_->setAvailable(true, clock_->now());
    auto market = makeService();

    EXPECT_FALSE(market->getFundPortfolio("abc", false).success);

    auto first = market->getFundPortfolio("161725", false);
    ASSERT_TRUE(first.success);
    EXPECT_EQ(first.data.positions.size(), 1u);

    clock_->advance(3600.0);
    market->getFundPortfolio("161725", false);
    EXPECT_EQ(portfolio_->calls(), 1);

    market->getFundPortfolio("161725", true);
    EXPECT_EQ(portfolio_->calls(), 2);
}

TEST_F(MarketServiceTest, PortfolioFallsBackToCacheOnFailure) {
    portfolio_->setAvailable(true, clock_->now());
    auto market = makeService();
    market->getFundPortfolio("161725", false);

    portfolio_->setAvailable(false);
    auto fallback = market->getFundPortfolio("161725", true);
    ASSERT_TRUE(fallback.success);
    EXPECT_EQ(fallback.message, "refresh failed, serving cached portfolio");
    EXPECT_EQ(fallback.data.report_period, "2024-06-30");

    EXPECT_FALSE(market->getFundPortfolio("000001", false).success);
}

// Holdings

TEST_F(MarketServiceTest, UpsertHoldingValidates) {
    auto market = makeService();
    EXPECT_FALSE(market->upsertHolding("1234", 1.0, 100.0, "").success);
    EXPECT_FALSE(market->upsertHolding("161725", 0.0, 100.0, "").success);
    EXPECT_FALSE(market->upsertHolding("161725", 1.0, -5.0, "").success);
    EXPECT_TRUE(market->getHoldingList().empty());
}

TEST_F(MarketServiceTest, HoldingNameResolvedFromProvidersOrDefaulted) {
    fundsSucceed(1.1);
    auto market = makeService();

    ASSERT_TRUE(market->upsertHolding("161725", 1.0, 1000.0, "core").success);
    funds_->fail();
    ASSERT_TRUE(market->upsertHolding("000002", 2.0, 10.0, "").success);

    auto holdings = market->getHoldingList();
    ASSERT_EQ(holdings.size(), 2u);
    EXPECT_EQ(holdings[0].name, "Index Fund 161725");
    EXPECT_EQ(holdings[0].note, "core");
    EXPECT_EQ(holdings[1].name, "Fund 000002");
}

TEST_F(MarketServiceTest, HoldingsReflectChangesImmediately) {
    fundsSucceed(1.1);
    auto market = makeService();
    market->upsertHolding("161725", 1.0, 1000.0, "");

    auto first = market->getHoldings(true, false);
    ASSERT_TRUE(first.success);
    ASSERT_EQ(first.data.items.size(), 1u);
    EXPECT_DOUBLE_EQ(first.data.items[0].market_value, 1100.0);
    EXPECT_DOUBLE_EQ(first.data.items[0].daily_profit, 10.0);

    market->upsertHolding("161725", 1.0, 2000.0, "");
    auto updated = market->getHoldings(true, false);
    ASSERT_EQ(updated.data.items.size(), 1u);
    EXPECT_DOUBLE_EQ(updated.data.items[0].market_value, 2200.0);

    EXPECT_FALSE(market->deleteHolding("000001").success);
    EXPECT_TRUE(market->deleteHolding("161725").success);
    EXPECT_TRUE(market->getHoldings(true, false).data.items.empty());
}

// Records, alerts and persistence

TEST_F(MarketServiceTest, RecordsAndAlertsArePersisted) {
    auto market = makeService();

    auto record = market->addRecord(552.3, 540.0, 1.77, "note");
    ASSERT_TRUE(record.success);
    EXPECT_DOUBLE_EQ(record.data.timestamp, clock_->now());
    EXPECT_EQ(market->getRecords().size(), 1u);

    data::AlertSettings alerts;
    alerts.high = 560.0;
    alerts.low = 540.0;
    alerts.enabled = true;
    ASSERT_TRUE(market->updateAlertSettings(alerts).success);
    EXPECT_DOUBLE_EQ(market->getAlertSettings().high, 560.0);

    auto saved = store_->saved();
    ASSERT_TRUE(saved.has_value());
    EXPECT_EQ(saved->manual_records.size(), 1u);
    EXPECT_TRUE(saved->alert_settings.enabled);

    ASSERT_TRUE(market->clearRecords().success);
    EXPECT_TRUE(market->getRecords().empty());
    EXPECT_TRUE(store_->saved()->manual_records.empty());
}

TEST_F(MarketServiceTest, LoadStatePrunesExpiredData) {
    double now = clock_->now();

    persistence::StateSnapshot snapshot;
    data::ManualRecord old_record;
    old_record.timestamp = now - 8 * SECONDS_PER_DAY;
    data::ManualRecord recent_record;
    recent_record.timestamp = now - SECONDS_PER_DAY;
    snapshot.manual_records = {old_record, recent_record};

    double midnight = common::localDayStart(now);
    snapshot.price_history = {fixtures::makeQuote(540.0, "Gold", midnight - 60.0),
                              fixtures::makeQuote(552.3, "Gold", now - 5.0)};
    snapshot.fund_watchlist = {"161725"};
    store_->preload(snapshot);

    auto market = makeService();
    ASSERT_TRUE(market->loadState());

    EXPECT_EQ(market->getRecords().size(), 1u);
    ASSERT_EQ(market->historySize(), 1u);
    EXPECT_DOUBLE_EQ(market->getHistory()[0].price, 552.3);
    EXPECT_EQ(market->getWatchlist().size(), 1u);
}

TEST_F(MarketServiceTest, StateSurvivesRestart) {
    fundsSucceed(1.1);
    {
        auto market = makeService();
        market->addFund("161725");
        market->upsertHolding("161725", 1.0, 500.0, "");
        market->addRecord(552.3, 540.0, 1.77, "");
    }

    auto restarted = makeService();
    ASSERT_TRUE(restarted->loadState());
    EXPECT_EQ(restarted->getWatchlist(), (std::vector<std::string>{"161725"}));
    ASSERT_EQ(restarted->getHoldingList().size(), 1u);
    EXPECT_DOUBLE_EQ(restarted->getHoldingList()[0].shares, 500.0);
    EXPECT_EQ(restarted->getRecords().size(), 1u);
}

TEST_F(MarketServiceTest, StorageFailuresDoNotFailOperations) {
    auto market = makeService();

    store_->failLoads(true);
    EXPECT_FALSE(market->loadState());
    EXPECT_TRUE(market->getRecords().empty());

    store_->failSaves(true);
    EXPECT_TRUE(market->addRecord(552.3, 540.0, 1.77, "").success);
    EXPECT_EQ(market->getRecords().size(), 1u);
    EXPECT_FALSE(market->saveState());
}

TEST_F(MarketServiceTest, EmptyStoreLoadsCleanly) {
    auto market = makeService();
    EXPECT_TRUE(market->loadState());
    EXPECT_TRUE(market->getWatchlist().empty());
}

// Background work

TEST_F(MarketServiceTest, PollerFillsHistoryWhenEnabled) {
    gold_->succeedWith(552.3, clock_.get());
    auto market = makeService(true);

    market->startBackground();
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (market->historySize() < 2 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    market->stopBackground();

    EXPECT_GE(market->historySize(), 2u);
    EXPECT_FALSE(market->poller().isRunning());
    EXPECT_GE(store_->saveCount(), 2);
}

TEST_F(MarketServiceTest, DisabledPollerDoesNotStart) {
    auto market = makeService();
    market->startBackground();
    EXPECT_FALSE(market->poller().isRunning());
}
