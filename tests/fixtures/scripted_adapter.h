/**
 * Quote adapter whose responses are set by the test
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "pricewatch/common/clock.h"
#include "pricewatch/data/fetch_adapters.h"

namespace pricewatch {
namespace fixtures {

inline data::Quote makeQuote(double price, const std::string& source = "Test",
                             double timestamp = 0.0, const std::string& code = "") {
    data::Quote quote;
    quote.code = code;
    quote.name = code.empty() ? "Au99.99" : "Fund " + code;
    quote.price = price;
    quote.open = price;
    quote.high = price;
    quote.low = price;
    quote.prev_close = price;
    quote.timestamp = timestamp;
    quote.time_str = "12:00:00";
    quote.source = source;
    return quote;
}

// One-shot latch that blocks adapter calls until the test opens it
class Gate {
public:
    void open() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = true;
        }
        cv_.notify_all();
    }

    void wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]() { return open_; });
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool open_ = false;
};

class ScriptedAdapter : public data::QuoteAdapter {
public:
    using Handler = std::function<std::optional<data::Quote>(const data::SourceDescriptor&, const std::string&)>;

    ScriptedAdapter() = default;
    explicit ScriptedAdapter(Handler handler) : handler_(std::move(handler)) {}

    std::optional<data::Quote> fetch(const data::SourceDescriptor& source, const std::string& key) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            keys_.push_back(key);
        }
        calls_++;

        Gate* gate = gate_.load();
        if (gate) {
            gate->wait();
        }

        Handler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handler = handler_;
        }
        if (!handler) {
            return std::nullopt;
        }
        return handler(source, key);
    }

    // Every call succeeds with price, tagged with the calling source and key;
    // stamped with clock->now() when a clock is given
    void succeedWith(double price, const common::Clock* clock = nullptr) {
        setHandler([price, clock](const data::SourceDescriptor& source, const std::string& key) {
            double timestamp = clock ? clock->now() : 0.0;
            return std::optional<data::Quote>(makeQuote(price, source.name, timestamp, key));
        });
    }

    // Every call fails
    void fail() {
        setHandler(nullptr);
    }

    void setHandler(Handler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        handler_ = std::move(handler);
    }

    // Calls block until the gate opens
    void blockOn(Gate* gate) { gate_ = gate; }

    int calls() const { return calls_.load(); }

    std::vector<std::string> keys() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return keys_;
    }

private:
    Handler handler_;
    std::atomic<Gate*> gate_{nullptr};
    std::atomic<int> calls_{0};
    mutable std::mutex mutex_;
    std::vector<std::string> keys_;
};

} // namespace fixtures
} // namespace pricewatch
