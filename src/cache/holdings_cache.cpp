/**
 * Holdings cache implementation
 */

#include <map>
#include <string>

#include "pricewatch/analytics/calculator.h"
#include "pricewatch/cache/holdings_cache.h"
#include "pricewatch/common/logging.h"

namespace pricewatch {
namespace cache {

HoldingsCache::HoldingsCache(QuoteCache& quotes,
                             RefreshCoordinator& coordinator,
                             const common::Clock& clock,
                             const CacheTtl& ttl,
                             std::recursive_mutex& mutex)
    : quotes_(quotes),
      coordinator_(coordinator),
      clock_(clock),
      ttl_(ttl),
      mutex_(mutex) {
}

data::HoldingsResponse HoldingsCache::get(const std::vector<data::Holding>& holdings,
                                          bool fast_mode, bool force_refresh) {
    if (!force_refresh) {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (response_) {
            Freshness freshness = classifyAge(clock_.now() - computed_at_, ttl_);
            if (freshness == Freshness::FRESH) {
                return *response_;
            }
            if (fast_mode && freshness == Freshness::STALE) {
                data::HoldingsResponse stale = *response_;
                stale.stale = true;
                coordinator_.schedule(RefreshScope::HOLDINGS, [this, holdings]() { recompute(holdings); });
                return stale;
            }
        }
    }
    return recompute(holdings);
}

void HoldingsCache::invalidate() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    response_.reset();
    computed_at_ = 0.0;
    generation_++;
}

data::HoldingsResponse HoldingsCache::recompute(const std::vector<data::Holding>& holdings) {
    uint64_t generation;
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        generation = generation_;
    }
    double started = clock_.now();

    std::vector<std::string> codes;
    codes.reserve(holdings.size());
    for (const auto& holding : holdings) {
        codes.push_back(holding.code);
    }

    // Network I/O, outside the lock
    std::map<std::string, data::Quote> fresh;
    if (!codes.empty()) {
        for (const auto& item : quotes_.fetchBatch(codes)) {
            if (item.second.ok()) {
                fresh[item.first] = *item.second.quote;
            }
        }
    }

    // Failed codes still hold their previous entry
    std::map<std::string, data::Quote> cached = quotes_.lookupMany(codes);

    data::HoldingsResponse response = analytics::buildHoldingsResponse(holdings, fresh, cached, started);
    if (!store(response, started, generation)) {
        LOG_DEBUG("Holdings changed during recompute, result not cached");
    }
    return response;
}

bool HoldingsCache::hasResponse() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return response_.has_value();
}

uint64_t HoldingsCache::generation() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return generation_;
}

bool HoldingsCache::store(const data::HoldingsResponse& response, double computed_at, uint64_t generation) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (generation != generation_) {
        return false;
    }
    response_ = response;
    computed_at_ = computed_at;
    return true;
}

} // namespace cache
} // namespace pricewatch
