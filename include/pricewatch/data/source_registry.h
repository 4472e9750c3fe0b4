/**
 * Ordered data-source registry with per-source circuit breaker state
 */

#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "pricewatch/common/clock.h"
#include "pricewatch/common/config.h"

namespace pricewatch {
namespace data {

struct SourceDescriptor {
    std::string name;
    std::string type;          // Selects the fetch adapter
    bool enabled = true;
    int timeout_s = 5;

    // Breaker state
    int fail_count = 0;
    double mute_until = 0.0;   // Epoch seconds, 0 = not muted

    bool isMutedAt(double now) const { return mute_until > now; }
};

/**
 * Source list in configured priority order. Breaker fields are only
 * mutated through recordSuccess/recordFailure, under the shared state lock.
 */
class SourceRegistry {
public:
    SourceRegistry(const std::vector<common::SourceConfig>& sources,
                   const common::BreakerConfig& breaker,
                   const common::Clock& clock,
                   std::recursive_mutex& mutex);

    // Snapshot of enabled sources, priority order preserved
    std::vector<SourceDescriptor> getEnabledSources() const;

    // Snapshot of all sources
    std::vector<SourceDescriptor> getSources() const;

    std::optional<SourceDescriptor> find(const std::string& name) const;

    // Close the breaker: fail_count = 0, mute_until = 0
    void recordSuccess(const std::string& name);

    // Count a failure; returns true when this failure tripped the breaker
    bool recordFailure(const std::string& name);

    double now() const { return clock_.now(); }
    int maxFailCount() const { return max_fail_count_; }
    double muteDuration() const { return mute_duration_s_; }

private:
    SourceDescriptor* findLocked(const std::string& name);

    std::vector<SourceDescriptor> sources_;
    int max_fail_count_;
    double mute_duration_s_;
    const common::Clock& clock_;
    std::recursive_mutex& mutex_;
};

} // namespace data
} // namespace pricewatch
