/**
 * Background poller implementation
 */

#include <chrono>
#include <utility>

#include "pricewatch/common/logging.h"
#include "pricewatch/service/background_poller.h"

namespace pricewatch {
namespace service {

BackgroundPoller::BackgroundPoller(data::FailoverFetcher& fetcher,
                                   cache::TimeSeriesBuffer& buffer,
                                   const common::PollerConfig& config,
                                   PersistCallback persist)
    : fetcher_(fetcher),
      buffer_(buffer),
      persist_(std::move(persist)),
      interval_ms_(config.interval_ms),
      error_backoff_ms_(config.error_backoff_ms) {
}

BackgroundPoller::~BackgroundPoller() {
    stop();
}

void BackgroundPoller::start() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (running_.exchange(true)) {
        return;
    }

    poll_thread_ = std::thread([this]() { run(); });

    LOG_INFO("Background poller started, interval " + std::to_string(interval_ms_) + "ms");
}

void BackgroundPoller::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    cv_.notify_all();

    if (poll_thread_.joinable()) {
        poll_thread_.join();
    }

    LOG_INFO("Background poller stopped after " + std::to_string(cycles_.load()) + " cycles");
}

bool BackgroundPoller::pollOnce() {
    cycles_++;

    data::FetchResult result = fetcher_.fetch();
    if (!result.ok()) {
        return false;
    }

    buffer_.append(*result.quote);
    if (persist_) {
        persist_();
    }
    return true;
}

void BackgroundPoller::run() {
    while (running_) {
        int wait_ms = interval_ms_;

        try {
            pollOnce();
        } catch (const std::exception& e) {
            errors_++;
            wait_ms = error_backoff_ms_;
            LOG_ERROR(std::string("Background poll failed: ") + e.what());
        }

        // Wait for next interval
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, std::chrono::milliseconds(wait_ms),
                     [this]() { return !running_; });
    }
}

} // namespace service
} // namespace pricewatch
