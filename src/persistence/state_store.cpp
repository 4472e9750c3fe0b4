/**
 * JSON file state store implementation
 */

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <fcntl.h>
#include <unistd.h>

#include "pricewatch/persistence/state_store.h"

using json = nlohmann::json;

namespace pricewatch {
namespace data {

// nlohmann::json conversions, found by ADL

void to_json(json& j, const Quote& q) {
    j = json{{"code", q.code},
             {"name", q.name},
             {"price", q.price},
             {"open", q.open},
             {"high", q.high},
             {"low", q.low},
             {"prev_close", q.prev_close},
             {"change", q.change},
             {"change_percent", q.change_percent},
             {"timestamp", q.timestamp},
             {"time", q.time_str},
             {"source", q.source}};
}

void from_json(const json& j, Quote& q) {
    q.code = j.value("code", "");
    q.name = j.value("name", "");
    q.price = j.value("price", 0.0);
    q.open = j.value("open", q.price);
    q.high = j.value("high", q.price);
    q.low = j.value("low", q.price);
    q.prev_close = j.value("prev_close", q.price);
    q.change = j.value("change", 0.0);
    q.change_percent = j.value("change_percent", 0.0);
    q.timestamp = j.value("timestamp", 0.0);
    q.time_str = j.value("time", "");
    q.source = j.value("source", "");
}

void to_json(json& j, const Holding& h) {
    j = json{{"code", h.code},
             {"name", h.name},
             {"cost_price", h.cost_price},
             {"shares", h.shares},
             {"note", h.note}};
}

void from_json(const json& j, Holding& h) {
    h.code = j.at("code").get<std::string>();
    h.name = j.value("name", "");
    h.cost_price = j.value("cost_price", 0.0);
    h.shares = j.value("shares", 0.0);
    h.note = j.value("note", "");
}

void to_json(json& j, const ManualRecord& r) {
    j = json{{"price", r.price},
             {"buy_price", r.buy_price},
             {"profit", r.profit},
             {"timestamp", r.timestamp},
             {"time", r.time_str},
             {"note", r.note}};
}

void from_json(const json& j, ManualRecord& r) {
    r.price = j.value("price", 0.0);
    r.buy_price = j.value("buy_price", 0.0);
    r.profit = j.value("profit", 0.0);
    r.timestamp = j.value("timestamp", 0.0);
    r.time_str = j.value("time", "");
    r.note = j.value("note", "");
}

void to_json(json& j, const AlertSettings& a) {
    j = json{{"high", a.high},
             {"low", a.low},
             {"enabled", a.enabled},
             {"trading_events_enabled", a.trading_events_enabled}};
}

void from_json(const json& j, AlertSettings& a) {
    a.high = j.value("high", 0.0);
    a.low = j.value("low", 0.0);
    a.enabled = j.value("enabled", false);
    a.trading_events_enabled = j.value("trading_events_enabled", true);
}

void to_json(json& j, const StockPosition& p) {
    j = json{{"code", p.code}, {"name", p.name}, {"weight", p.weight}};
}

void from_json(const json& j, StockPosition& p) {
    p.code = j.value("code", "");
    p.name = j.value("name", "");
    p.weight = j.value("weight", 0.0);
}

void to_json(json& j, const FundPortfolio& p) {
    j = json{{"code", p.code},
             {"report_period", p.report_period},
             {"fetched_at", p.fetched_at},
             {"positions", p.positions}};
}

void from_json(const json& j, FundPortfolio& p) {
    p.code = j.value("code", "");
    p.report_period = j.value("report_period", "");
    p.fetched_at = j.value("fetched_at", 0.0);
    p.positions = j.value("positions", std::vector<StockPosition>());
}

} // namespace data

namespace persistence {

json snapshotToJson(const StateSnapshot& snapshot) {
    json document;
    document["manual_records"] = snapshot.manual_records;
    document["price_history"] = snapshot.price_history;
    document["alert_settings"] = snapshot.alert_settings;
    document["fund_watchlist"] = snapshot.fund_watchlist;
    document["fund_holdings"] = snapshot.fund_holdings;
    document["fund_portfolios"] = snapshot.fund_portfolios;
    return document;
}

StateSnapshot snapshotFromJson(const json& document) {
    if (!document.is_object()) {
        throw std::runtime_error("state document is not an object");
    }

    // Missing sections load as empty
    StateSnapshot snapshot;
    snapshot.manual_records = document.value("manual_records", std::vector<data::ManualRecord>());
    snapshot.price_history = document.value("price_history", std::vector<data::Quote>());
    snapshot.alert_settings = document.value("alert_settings", data::AlertSettings());
    snapshot.fund_watchlist = document.value("fund_watchlist", std::vector<std::string>());
    snapshot.fund_holdings = document.value("fund_holdings", std::vector<data::Holding>());
    snapshot.fund_portfolios =
        document.value("fund_portfolios", std::map<std::string, data::FundPortfolio>());
    return snapshot;
}

JsonFileStore::JsonFileStore(std::string path)
    : path_(std::move(path)) {
    if (path_.empty()) {
        throw std::invalid_argument("JsonFileStore path must not be empty");
    }
}

void JsonFileStore::save(const StateSnapshot& snapshot) {
    namespace fs = std::filesystem;

    fs::path target(path_);
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("Cannot create directory " + target.parent_path().string() +
                                     ": " + ec.message());
        }
    }

    std::string tmp_path = path_ + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::out | std::ios::trunc);
        if (!out) {
            throw std::runtime_error("Cannot open " + tmp_path + " for writing");
        }
        out << snapshotToJson(snapshot).dump(2);
        out.flush();
        if (!out) {
            throw std::runtime_error("Write to " + tmp_path + " failed");
        }
    }

    // Make the bytes durable before the rename publishes them
    int fd = ::open(tmp_path.c_str(), O_WRONLY);
    if (fd < 0) {
        throw std::runtime_error("Cannot reopen " + tmp_path + " for sync");
    }
    int sync_result = ::fsync(fd);
    ::close(fd);
    if (sync_result != 0) {
        throw std::runtime_error("fsync of " + tmp_path + " failed");
    }

    fs::rename(tmp_path, target, ec);
    if (ec) {
        throw std::runtime_error("Cannot replace " + path_ + ": " + ec.message());
    }
}

std::optional<StateSnapshot> JsonFileStore::load() {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return std::nullopt;
    }

    std::ifstream in(path_);
    if (!in) {
        throw std::runtime_error("Cannot open state file " + path_);
    }

    try {
        json document = json::parse(in);
        return snapshotFromJson(document);
    } catch (const json::exception& e) {
        throw std::runtime_error("Corrupt state file " + path_ + ": " + e.what());
    }
}

} // namespace persistence
} // namespace pricewatch
