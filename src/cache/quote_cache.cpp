/**
 * Quote cache implementation
 */

#include <future>
#include <set>
#include <utility>

#include "pricewatch/cache/quote_cache.h"
#include "pricewatch/common/logging.h"

namespace pricewatch {
namespace cache {

Freshness classifyAge(double age_s, const CacheTtl& ttl) {
    if (age_s < ttl.fresh_s) {
        return Freshness::FRESH;
    }
    if (age_s < ttl.stale_s) {
        return Freshness::STALE;
    }
    return Freshness::EXPIRED;
}

QuoteCache::QuoteCache(data::FailoverFetcher& fetcher,
                       common::WorkerPool& pool,
                       RefreshCoordinator& coordinator,
                       const common::Clock& clock,
                       const CacheTtl& ttl,
                       std::recursive_mutex& mutex)
    : fetcher_(fetcher),
      pool_(pool),
      coordinator_(coordinator),
      clock_(clock),
      ttl_(ttl),
      mutex_(mutex) {
}

std::map<std::string, data::Quote> QuoteCache::getMany(const std::vector<std::string>& keys, bool fast_mode) {
    std::map<std::string, data::Quote> results;
    std::vector<std::string> to_fetch;
    std::vector<std::string> to_refresh;
    std::set<std::string> seen;

    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        double now = clock_.now();

        for (const auto& key : keys) {
            if (!seen.insert(key).second) {
                continue;
            }

            auto it = entries_.find(key);
            if (it != entries_.end()) {
                Freshness freshness = classifyAge(now - it->second.fetched_at, ttl_);
                if (freshness == Freshness::FRESH) {
                    results[key] = it->second.quote;
                    continue;
                }
                if (fast_mode && freshness == Freshness::STALE) {
                    data::Quote quote = it->second.quote;
                    data::annotateSource(quote, data::STALE_MARKER);
                    results[key] = quote;
                    to_refresh.push_back(key);
                    continue;
                }
            }
            to_fetch.push_back(key);
        }
    }

    if (!to_refresh.empty()) {
        scheduleAsyncRefresh(to_refresh);
    }

    if (to_fetch.empty()) {
        return results;
    }

    std::map<std::string, data::FetchResult> fetched = fetchBatch(to_fetch);

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    for (const auto& key : to_fetch) {
        auto result = fetched.find(key);
        if (result != fetched.end() && result->second.ok()) {
            results[key] = *result->second.quote;
            continue;
        }

        // Degrade to the last known value, then to a placeholder
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            data::Quote quote = it->second.quote;
            data::annotateSource(quote, data::EXPIRED_MARKER);
            results[key] = quote;
        } else {
            results[key] = placeholder(key);
        }
    }
    return results;
}

std::optional<CacheEntry> QuoteCache::lookup(const std::string& key) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::map<std::string, data::Quote> QuoteCache::lookupMany(const std::vector<std::string>& keys) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    std::map<std::string, data::Quote> quotes;
    for (const auto& key : keys) {
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            quotes[key] = it->second.quote;
        }
    }
    return quotes;
}

Freshness QuoteCache::classify(const CacheEntry& entry) const {
    return classifyAge(clock_.now() - entry.fetched_at, ttl_);
}

void QuoteCache::put(const std::string& key, const data::Quote& quote) {
    if (!quote.isValid()) {
        return;
    }
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    CacheEntry& entry = entries_[key];
    entry.quote = quote;
    entry.fetched_at = clock_.now();
}

void QuoteCache::erase(const std::string& key) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    entries_.erase(key);
}

size_t QuoteCache::size() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return entries_.size();
}

std::map<std::string, data::FetchResult> QuoteCache::fetchBatch(const std::vector<std::string>& keys) {
    std::map<std::string, data::FetchResult> results;
    std::vector<std::pair<std::string, std::future<data::FetchResult>>> pending;

    for (const auto& key : keys) {
        if (results.count(key)) {
            continue;
        }
        try {
            pending.emplace_back(key, pool_.submit([this, key]() { return fetcher_.fetch(key); }));
            results[key] = data::FetchResult();
        } catch (const std::exception& e) {
            LOG_WARNING("Could not queue fetch for " + key + ": " + e.what());
            data::FetchResult failed;
            failed.error = data::FetchError::ALL_SOURCES_FAILED;
            results[key] = failed;
        }
    }

    for (auto& item : pending) {
        data::FetchResult& result = results[item.first];
        try {
            result = item.second.get();
        } catch (const std::exception& e) {
            LOG_ERROR("Fetch task for " + item.first + " failed: " + e.what());
            result.quote.reset();
            result.error = data::FetchError::ALL_SOURCES_FAILED;
        }

        if (result.ok()) {
            put(item.first, *result.quote);
        }
    }
    return results;
}

bool QuoteCache::scheduleAsyncRefresh(const std::vector<std::string>& keys) {
    std::vector<std::string> copy = keys;
    return coordinator_.schedule(RefreshScope::FUNDS, [this, copy]() {
        std::map<std::string, data::FetchResult> results = fetchBatch(copy);

        size_t refreshed = 0;
        for (const auto& item : results) {
            if (item.second.ok()) {
                refreshed++;
            }
        }
        LOG_DEBUG("Background fund refresh updated " + std::to_string(refreshed) + "/" +
                  std::to_string(copy.size()) + " quotes");
    });
}

data::Quote QuoteCache::placeholder(const std::string& key) {
    data::Quote quote;
    quote.code = key;
    quote.name = "load failed";
    quote.price = 0.0;
    quote.time_str = "--";
    quote.source = data::ERROR_SOURCE;
    return quote;
}

} // namespace cache
} // namespace pricewatch
