/**
 * Two-tier (fresh / stale) per-key quote cache
 */

#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "pricewatch/cache/refresh_coordinator.h"
#include "pricewatch/common/clock.h"
#include "pricewatch/common/worker_pool.h"
#include "pricewatch/data/failover_fetcher.h"
#include "pricewatch/data/quote.h"

namespace pricewatch {
namespace cache {

enum class Freshness {
    FRESH,
    STALE,
    EXPIRED
};

// fresh if age < fresh_s, stale if age < stale_s, else expired
struct CacheTtl {
    double fresh_s = 30.0;
    double stale_s = 120.0;
};

Freshness classifyAge(double age_s, const CacheTtl& ttl);

struct CacheEntry {
    data::Quote quote;
    double fetched_at = 0.0;
};

/**
 * Quote cache keyed by fund code.
 *
 * getMany() serves fresh entries directly, serves stale entries in fast
 * mode while refreshing them in the background, and fetches everything
 * else synchronously through the worker pool. Stored entries are never
 * annotated; markers are applied to the copies handed out.
 */
class QuoteCache {
public:
    QuoteCache(data::FailoverFetcher& fetcher,
               common::WorkerPool& pool,
               RefreshCoordinator& coordinator,
               const common::Clock& clock,
               const CacheTtl& ttl,
               std::recursive_mutex& mutex);

    // Exactly one quote per distinct requested key
    std::map<std::string, data::Quote> getMany(const std::vector<std::string>& keys, bool fast_mode);

    std::optional<CacheEntry> lookup(const std::string& key) const;

    // Unannotated cached quotes for the keys that have an entry
    std::map<std::string, data::Quote> lookupMany(const std::vector<std::string>& keys) const;

    Freshness classify(const CacheEntry& entry) const;

    // Store a valid quote stamped with the current time
    void put(const std::string& key, const data::Quote& quote);
    void erase(const std::string& key);
    size_t size() const;

    // One failover fetch per key on the worker pool; successes are written to the cache
    std::map<std::string, data::FetchResult> fetchBatch(const std::vector<std::string>& keys);

    // Background fetchBatch under the FUNDS guard; false if one is already in flight
    bool scheduleAsyncRefresh(const std::vector<std::string>& keys);

    const CacheTtl& ttl() const { return ttl_; }

    // Record returned for a key with no data at all
    static data::Quote placeholder(const std::string& key);

private:
    data::FailoverFetcher& fetcher_;
    common::WorkerPool& pool_;
    RefreshCoordinator& coordinator_;
    const common::Clock& clock_;
    CacheTtl ttl_;
    std::recursive_mutex& mutex_;

    std::unordered_map<std::string, CacheEntry> entries_;
};

} // namespace cache
} // namespace pricewatch
