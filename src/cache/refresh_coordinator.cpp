/**
 * Refresh coordinator implementation
 */

#include <utility>
#include <vector>

#include "pricewatch/cache/refresh_coordinator.h"
#include "pricewatch/common/logging.h"

namespace pricewatch {
namespace cache {

namespace {

size_t slotIndex(RefreshScope scope) {
    return static_cast<size_t>(scope);
}

} // namespace

const char* refreshScopeName(RefreshScope scope) {
    switch (scope) {
        case RefreshScope::FUNDS:
            return "funds";
        case RefreshScope::HOLDINGS:
            return "holdings";
    }
    return "unknown";
}

RefreshCoordinator::RefreshCoordinator() = default;

RefreshCoordinator::~RefreshCoordinator() {
    shutdown();
}

bool RefreshCoordinator::schedule(RefreshScope scope, std::function<void()> job) {
    std::lock_guard<std::mutex> lock(mutex_);
    Slot& slot = slots_[slotIndex(scope)];

    if (stopped_ || slot.busy) {
        skipped_++;
        LOG_DEBUG(std::string("Refresh for ") + refreshScopeName(scope) + " already in flight, skipping");
        return false;
    }

    // Previous job has released the slot; reap its thread
    if (slot.worker.joinable()) {
        slot.worker.join();
    }

    slot.busy = true;
    scheduled_++;
    slot.worker = std::thread(&RefreshCoordinator::runJob, this, scope, std::move(job));

    LOG_DEBUG(std::string("Scheduled background refresh for ") + refreshScopeName(scope));
    return true;
}

bool RefreshCoordinator::inFlight(RefreshScope scope) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_[slotIndex(scope)].busy;
}

void RefreshCoordinator::waitIdle(RefreshScope scope) {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this, scope]() { return !slots_[slotIndex(scope)].busy; });
}

void RefreshCoordinator::shutdown() {
    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
        for (auto& slot : slots_) {
            if (slot.worker.joinable()) {
                workers.push_back(std::move(slot.worker));
            }
        }
    }

    for (auto& worker : workers) {
        worker.join();
    }
}

void RefreshCoordinator::runJob(RefreshScope scope, const std::function<void()>& job) {
    // Releases the slot on every exit path
    struct SlotGuard {
        RefreshCoordinator* owner;
        RefreshScope scope;
        ~SlotGuard() { owner->release(scope); }
    } guard{this, scope};

    try {
        job();
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Background refresh for ") + refreshScopeName(scope) + " failed: " + e.what());
    } catch (...) {
        // Nothing above this frame on the worker thread can handle it
        LOG_ERROR(std::string("Background refresh for ") + refreshScopeName(scope) + " failed: non-standard exception");
    }
}

void RefreshCoordinator::release(RefreshScope scope) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        slots_[slotIndex(scope)].busy = false;
    }
    idle_cv_.notify_all();
}

} // namespace cache
} // namespace pricewatch
