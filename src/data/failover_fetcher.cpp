/**
 * Failover fetcher implementation
 */

#include <exception>
#include <utility>

#include "pricewatch/common/logging.h"
#include "pricewatch/data/failover_fetcher.h"

namespace pricewatch {
namespace data {

const char* fetchErrorMessage(FetchError error) {
    switch (error) {
        case FetchError::NONE:
            return "";
        case FetchError::NO_ENABLED_SOURCES:
            return "no enabled sources";
        case FetchError::ALL_SOURCES_MUTED:
            return "all sources cooling down";
        case FetchError::ALL_SOURCES_FAILED:
            return "all sources failed";
    }
    return "unknown fetch error";
}

FailoverFetcher::FailoverFetcher(SourceRegistry& registry, AdapterMap adapters)
    : registry_(registry), adapters_(std::move(adapters)) {
}

FetchResult FailoverFetcher::fetch(const std::string& key) {
    FetchResult result;
    std::vector<SourceDescriptor> sources = registry_.getEnabledSources();

    if (sources.empty()) {
        result.error = FetchError::NO_ENABLED_SOURCES;
        LOG_ERROR("Fetch failed" + (key.empty() ? std::string() : " for " + key) + ": " + result.message());
        return result;
    }

    for (const auto& source : sources) {
        if (source.isMutedAt(registry_.now())) {
            result.muted_count++;
            LOG_DEBUG("[" + source.name + "] muted, skipping");
            continue;
        }

        auto it = adapters_.find(source.type);
        if (it == adapters_.end() || !it->second) {
            LOG_DEBUG("[" + source.name + "] no adapter for type '" + source.type + "', skipping");
            continue;
        }

        // Network call, never under the state lock
        std::optional<Quote> quote;
        try {
            quote = it->second->fetch(source, key);
        } catch (const std::exception& e) {
            LOG_WARNING("[" + source.name + "] adapter error: " + e.what());
            quote.reset();
        }

        if (quote && quote->isValid()) {
            registry_.recordSuccess(source.name);
            result.quote = std::move(quote);
            result.error = FetchError::NONE;
            return result;
        }
        registry_.recordFailure(source.name);
    }

    if (result.muted_count == static_cast<int>(sources.size())) {
        result.error = FetchError::ALL_SOURCES_MUTED;
    } else {
        result.error = FetchError::ALL_SOURCES_FAILED;
    }

    LOG_ERROR("Fetch failed" + (key.empty() ? std::string() : " for " + key) + ": " + result.message());
    return result;
}

} // namespace data
} // namespace pricewatch
