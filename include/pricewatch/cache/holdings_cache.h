/**
 * Memoized aggregate holdings response
 */

#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

#include "pricewatch/cache/quote_cache.h"
#include "pricewatch/cache/refresh_coordinator.h"
#include "pricewatch/common/clock.h"
#include "pricewatch/data/records.h"

namespace pricewatch {
namespace cache {

/**
 * Single cached HoldingsResponse with its own TTL pair.
 *
 * Every invalidate() bumps a generation counter; a recompute only stores
 * its result if the generation it started under is still current.
 */
class HoldingsCache {
public:
    HoldingsCache(QuoteCache& quotes,
                  RefreshCoordinator& coordinator,
                  const common::Clock& clock,
                  const CacheTtl& ttl,
                  std::recursive_mutex& mutex);

    // Fresh -> cached; stale in fast mode -> cached copy with stale = true plus
    // background recompute; otherwise (or when forced) synchronous recompute
    data::HoldingsResponse get(const std::vector<data::Holding>& holdings, bool fast_mode, bool force_refresh);

    // Drop the cached response; in-flight recomputes will not store
    void invalidate();

    // Fetch every holding's quote, update the fund cache and build the response
    data::HoldingsResponse recompute(const std::vector<data::Holding>& holdings);

    bool hasResponse() const;
    uint64_t generation() const;

private:
    bool store(const data::HoldingsResponse& response, double computed_at, uint64_t generation);

    QuoteCache& quotes_;
    RefreshCoordinator& coordinator_;
    const common::Clock& clock_;
    CacheTtl ttl_;
    std::recursive_mutex& mutex_;

    std::optional<data::HoldingsResponse> response_;
    double computed_at_ = 0.0;
    uint64_t generation_ = 0;
};

} // namespace cache
} // namespace pricewatch
