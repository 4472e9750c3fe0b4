/**
 * State store kept in memory
 */

#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <stdexcept>

#include "pricewatch/persistence/state_store.h"

namespace pricewatch {
namespace fixtures {

class MemoryStateStore : public persistence::StateStore {
public:
    void save(const persistence::StateSnapshot& snapshot) override {
        std::lock_guard<std::mutex> lock(mutex_);
        saves_++;
        if (fail_saves_) {
            throw std::runtime_error("disk full");
        }
        saved_ = snapshot;
    }

    std::optional<persistence::StateSnapshot> load() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_loads_) {
            throw std::runtime_error("corrupt state");
        }
        return saved_;
    }

    void preload(const persistence::StateSnapshot& snapshot) {
        std::lock_guard<std::mutex> lock(mutex_);
        saved_ = snapshot;
    }

    std::optional<persistence::StateSnapshot> saved() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return saved_;
    }

    int saveCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return saves_;
    }

    void failSaves(bool fail) { fail_saves_ = fail; }
    void failLoads(bool fail) { fail_loads_ = fail; }

private:
    mutable std::mutex mutex_;
    std::optional<persistence::StateSnapshot> saved_;
    int saves_ = 0;
    std::atomic<bool> fail_saves_{false};
    std::atomic<bool> fail_loads_{false};
};

} // namespace fixtures
} // namespace pricewatch
