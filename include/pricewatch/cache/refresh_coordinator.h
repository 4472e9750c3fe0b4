/**
 * Single-flight background refresh per cache scope
 */

#pragma once

#include <array>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace pricewatch {
namespace cache {

enum class RefreshScope {
    FUNDS,
    HOLDINGS
};

const char* refreshScopeName(RefreshScope scope);

/**
 * Each scope owns one slot. schedule() starts the job on a dedicated
 * thread only when the slot is empty; the slot is released when the job
 * returns or throws.
 */
class RefreshCoordinator {
public:
    RefreshCoordinator();
    ~RefreshCoordinator();

    RefreshCoordinator(const RefreshCoordinator&) = delete;
    RefreshCoordinator& operator=(const RefreshCoordinator&) = delete;

    // False when a refresh for this scope is already in flight or after shutdown()
    bool schedule(RefreshScope scope, std::function<void()> job);

    bool inFlight(RefreshScope scope) const;

    // Block until no job of this scope is running
    void waitIdle(RefreshScope scope);

    // Refuse new jobs and join running ones
    void shutdown();

    // Jobs started / skipped since construction
    uint64_t scheduledCount() const { return scheduled_.load(); }
    uint64_t skippedCount() const { return skipped_.load(); }

private:
    static constexpr size_t SCOPE_COUNT = 2;

    struct Slot {
        bool busy = false;
        std::thread worker;
    };

    void runJob(RefreshScope scope, const std::function<void()>& job);
    void release(RefreshScope scope);

    std::array<Slot, SCOPE_COUNT> slots_;
    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    bool stopped_ = false;

    std::atomic<uint64_t> scheduled_{0};
    std::atomic<uint64_t> skipped_{0};
};

} // namespace cache
} // namespace pricewatch
