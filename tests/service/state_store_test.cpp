/**
 * JSON state file tests
 */

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <gtest/gtest.h>

#include "fixtures/scripted_adapter.h"
#include "pricewatch/persistence/state_store.h"

using namespace pricewatch;
namespace fs = std::filesystem;

namespace {

class JsonFileStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("pricewatch_state_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(dir_);
        path_ = (dir_ / "nested" / "data.json").string();
    }

    void TearDown() override {
        fs::remove_all(dir_);
    }

    void writeRaw(const std::string& text) {
        fs::create_directories(fs::path(path_).parent_path());
        std::ofstream out(path_);
        out << text;
    }

    persistence::StateSnapshot sampleSnapshot() const {
        persistence::StateSnapshot snapshot;

        data::ManualRecord record;
        record.price = 552.3;
        record.buy_price = 540.0;
        record.profit = 1.77;
        record.timestamp = 1704700000.0;
        record.time_str = "2024-01-08 15:46:40";
        record.note = "after close";
        snapshot.manual_records.push_back(record);

        snapshot.price_history.push_back(fixtures::makeQuote(552.3, "EastMoney", 1704700000.0));
        snapshot.alert_settings.high = 560.0;
        snapshot.alert_settings.low = 540.0;
        snapshot.alert_settings.enabled = true;
        snapshot.fund_watchlist = {"161725", "000001"};

        data::Holding holding;
        holding.code = "161725";
        holding.name = "Baijiu Index A";
        holding.cost_price = 0.95;
        holding.shares = 10000.0;
        snapshot.fund_holdings.push_back(holding);

        data::FundPortfolio portfolio;
        portfolio.code = "161725";
        portfolio.report_period = "2024-06-30";
        portfolio.fetched_at = 1704700000.0;
        portfolio.positions.push_back({"600519", "Kweichow Moutai", 15.12});
        snapshot.fund_portfolios["161725"] = portfolio;
        return snapshot;
    }

    fs::path dir_;
    std::string path_;
};

} // namespace

TEST_F(JsonFileStoreTest, MissingFileLoadsNothing) {
    persistence::JsonFileStore store(path_);
    EXPECT_FALSE(store.load().has_value());
}

TEST_F(JsonFileStoreTest, SaveCreatesDirectoriesAndReloads) {
    persistence::JsonFileStore store(path_);
    store.save(sampleSnapshot());

    EXPECT_TRUE(fs::exists(path_));
    EXPECT_FALSE(fs::exists(path_ + ".tmp"));

    auto loaded = store.load();
    ASSERT_TRUE(loaded.has_value());
    ASSERT_EQ(loaded->manual_records.size(), 1u);
    EXPECT_EQ(loaded->manual_records[0].note, "after close");
    ASSERT_EQ(loaded->price_history.size(), 1u);
    EXPECT_EQ(loaded->price_history[0].source, "EastMoney");
    EXPECT_DOUBLE_EQ(loaded->price_history[0].timestamp, 1704700000.0);
    EXPECT_TRUE(loaded->alert_settings.enabled);
    EXPECT_DOUBLE_EQ(loaded->alert_settings.high, 560.0);
    EXPECT_EQ(loaded->fund_watchlist, (std::vector<std::string>{"161725", "000001"}));
    ASSERT_EQ(loaded->fund_holdings.size(), 1u);
    EXPECT_DOUBLE_EQ(loaded->fund_holdings[0].shares, 10000.0);
    ASSERT_EQ(loaded->fund_portfolios.count("161725"), 1u);
    EXPECT_EQ(loaded->fund_portfolios["161725"].positions[0].name, "Kweichow Moutai");
}

TEST_F(JsonFileStoreTest, SaveReplacesPreviousContent) {
    persistence::JsonFileStore store(path_);
    store.save(sampleSnapshot());
    store.save(persistence::StateSnapshot());

    auto loaded = store.load();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_TRUE(loaded->manual_records.empty());
    EXPECT_TRUE(loaded->fund_watchlist.empty());
}

TEST_F(JsonFileStoreTest, MissingSectionsLoadEmpty) {
    writeRaw(R"({"fund_watchlist":["161725"]})");
    persistence::JsonFileStore store(path_);

    auto loaded = store.load();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->fund_watchlist.size(), 1u);
    EXPECT_TRUE(loaded->price_history.empty());
    EXPECT_TRUE(loaded->alert_settings.trading_events_enabled);
}

TEST_F(JsonFileStoreTest, CorruptFileThrows) {
    writeRaw("{\"manual_records\": [");
    persistence::JsonFileStore store(path_);

    try {
        store.load();
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("Corrupt state file"), std::string::npos);
    }
}

TEST_F(JsonFileStoreTest, HoldingWithoutCodeRejected) {
    writeRaw(R"({"fund_holdings":[{"name":"nameless","shares":1}]})");
    persistence::JsonFileStore store(path_);
    EXPECT_THROW(store.load(), std::runtime_error);
}

TEST(JsonFileStorePathTest, EmptyPathRejected) {
    EXPECT_THROW(persistence::JsonFileStore(""), std::invalid_argument);
}
