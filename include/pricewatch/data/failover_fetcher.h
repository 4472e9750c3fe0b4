/**
 * Priority-ordered failover across the sources of one registry
 */

#pragma once

#include <optional>
#include <string>

#include "pricewatch/data/fetch_adapters.h"
#include "pricewatch/data/quote.h"
#include "pricewatch/data/source_registry.h"

namespace pricewatch {
namespace data {

// Terminal reason when no source produced a quote
enum class FetchError {
    NONE,
    NO_ENABLED_SOURCES,
    ALL_SOURCES_MUTED,
    ALL_SOURCES_FAILED
};

const char* fetchErrorMessage(FetchError error);

struct FetchResult {
    std::optional<Quote> quote;
    FetchError error = FetchError::NONE;
    int muted_count = 0;     // Enabled sources skipped because their breaker was open

    bool ok() const { return quote.has_value(); }
    std::string message() const { return fetchErrorMessage(error); }
};

/**
 * Walks the registry in order and returns the first adapter success.
 * Adapter calls run without holding the state lock; only breaker updates
 * go through the registry.
 */
class FailoverFetcher {
public:
    FailoverFetcher(SourceRegistry& registry, AdapterMap adapters);

    // key is the fund code for fund registries, empty for commodity sources
    FetchResult fetch(const std::string& key = "");

    SourceRegistry& registry() { return registry_; }

private:
    SourceRegistry& registry_;
    AdapterMap adapters_;
};

} // namespace data
} // namespace pricewatch
