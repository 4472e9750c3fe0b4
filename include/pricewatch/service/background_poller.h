/**
 * Continuous background price poller
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

#include "pricewatch/cache/time_series_buffer.h"
#include "pricewatch/common/config.h"
#include "pricewatch/data/failover_fetcher.h"

namespace pricewatch {
namespace service {

/**
 * Fetches the commodity quote every interval_ms and appends it to the
 * buffer, then runs the persist callback. An exception widens the next
 * wait to error_backoff_ms; only stop() ends the loop.
 */
class BackgroundPoller {
public:
    using PersistCallback = std::function<void()>;

    BackgroundPoller(data::FailoverFetcher& fetcher,
                     cache::TimeSeriesBuffer& buffer,
                     const common::PollerConfig& config,
                     PersistCallback persist = nullptr);
    ~BackgroundPoller();

    BackgroundPoller(const BackgroundPoller&) = delete;
    BackgroundPoller& operator=(const BackgroundPoller&) = delete;

    void start();
    void stop();
    bool isRunning() const { return running_; }

    // One cycle; true if a quote was appended. Exceptions propagate.
    bool pollOnce();

    uint64_t cycleCount() const { return cycles_.load(); }
    uint64_t errorCount() const { return errors_.load(); }

private:
    void run();

    data::FailoverFetcher& fetcher_;
    cache::TimeSeriesBuffer& buffer_;
    PersistCallback persist_;
    int interval_ms_;
    int error_backoff_ms_;

    // Thread management; lifecycle_mutex_ serializes start() and stop()
    std::mutex lifecycle_mutex_;
    std::thread poll_thread_;
    std::atomic<bool> running_{false};
    std::mutex mutex_;
    std::condition_variable cv_;

    std::atomic<uint64_t> cycles_{0};
    std::atomic<uint64_t> errors_{0};
};

} // namespace service
} // namespace pricewatch
