/**
 * Source registry implementation
 */

#include <algorithm>

#include "pricewatch/common/logging.h"
#include "pricewatch/data/source_registry.h"

namespace pricewatch {
namespace data {

SourceRegistry::SourceRegistry(const std::vector<common::SourceConfig>& sources,
                               const common::BreakerConfig& breaker,
                               const common::Clock& clock,
                               std::recursive_mutex& mutex)
    : max_fail_count_(std::max(1, breaker.max_fail_count)),
      mute_duration_s_(static_cast<double>(breaker.mute_duration_s)),
      clock_(clock),
      mutex_(mutex) {
    sources_.reserve(sources.size());
    for (const auto& config : sources) {
        SourceDescriptor descriptor;
        descriptor.name = config.name;
        descriptor.type = config.type;
        descriptor.enabled = config.enabled;
        descriptor.timeout_s = config.timeout_s;
        sources_.push_back(descriptor);
    }
}

std::vector<SourceDescriptor> SourceRegistry::getEnabledSources() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    std::vector<SourceDescriptor> enabled;
    for (const auto& source : sources_) {
        if (source.enabled) {
            enabled.push_back(source);
        }
    }
    return enabled;
}

std::vector<SourceDescriptor> SourceRegistry::getSources() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return sources_;
}

std::optional<SourceDescriptor> SourceRegistry::find(const std::string& name) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    for (const auto& source : sources_) {
        if (source.name == name) {
            return source;
        }
    }
    return std::nullopt;
}

void SourceRegistry::recordSuccess(const std::string& name) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    SourceDescriptor* source = findLocked(name);
    if (!source) {
        return;
    }
    source->fail_count = 0;
    source->mute_until = 0.0;
}

bool SourceRegistry::recordFailure(const std::string& name) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    SourceDescriptor* source = findLocked(name);
    if (!source) {
        return false;
    }

    source->fail_count += 1;
    if (source->fail_count < max_fail_count_) {
        return false;
    }

    // Trip: mute and start counting a fresh run after the cooldown
    source->mute_until = clock_.now() + mute_duration_s_;
    source->fail_count = 0;

    LOG_WARNING("Breaker tripped for " + source->name + " after " +
                std::to_string(max_fail_count_) + " consecutive failures, muted for " +
                std::to_string(static_cast<int>(mute_duration_s_)) + "s");
    return true;
}

SourceDescriptor* SourceRegistry::findLocked(const std::string& name) {
    auto it = std::find_if(sources_.begin(), sources_.end(),
                           [&name](const SourceDescriptor& s) { return s.name == name; });
    return it == sources_.end() ? nullptr : &*it;
}

} // namespace data
} // namespace pricewatch
