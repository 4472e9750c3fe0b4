/**
 * Persistent service state
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "pricewatch/data/quote.h"
#include "pricewatch/data/records.h"

namespace pricewatch {
namespace persistence {

// Everything that survives a restart
struct StateSnapshot {
    std::vector<data::ManualRecord> manual_records;
    std::vector<data::Quote> price_history;
    data::AlertSettings alert_settings;
    std::vector<std::string> fund_watchlist;
    std::vector<data::Holding> fund_holdings;
    std::map<std::string, data::FundPortfolio> fund_portfolios;
};

class StateStore {
public:
    virtual ~StateStore() = default;

    // Throws std::runtime_error on failure
    virtual void save(const StateSnapshot& snapshot) = 0;

    // nullopt when nothing was saved yet; throws std::runtime_error on unreadable data
    virtual std::optional<StateSnapshot> load() = 0;
};

/**
 * Single JSON document on disk. save() writes a sibling .tmp file,
 * syncs it and renames it over the target.
 */
class JsonFileStore : public StateStore {
public:
    explicit JsonFileStore(std::string path);

    void save(const StateSnapshot& snapshot) override;
    std::optional<StateSnapshot> load() override;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

nlohmann::json snapshotToJson(const StateSnapshot& snapshot);
StateSnapshot snapshotFromJson(const nlohmann::json& document);

} // namespace persistence
} // namespace pricewatch
