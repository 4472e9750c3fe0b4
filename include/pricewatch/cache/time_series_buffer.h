/**
 * Bounded price history buffer
 */

#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

#include "pricewatch/data/quote.h"

namespace pricewatch {
namespace cache {

/**
 * Insertion-ordered quotes, at most capacity() of them; appending to a
 * full buffer evicts the oldest point.
 */
class TimeSeriesBuffer {
public:
    TimeSeriesBuffer(size_t capacity, std::recursive_mutex& mutex);

    void append(const data::Quote& quote);

    // Replace contents, keeping the newest capacity() points
    void assign(const std::vector<data::Quote>& quotes);

    // Drop points with timestamp < cutoff; returns the number removed
    size_t pruneBefore(double cutoff);

    // Oldest first
    std::vector<data::Quote> snapshot() const;

    std::optional<data::Quote> latest() const;

    size_t size() const;
    size_t capacity() const { return capacity_; }
    bool empty() const;

private:
    size_t capacity_;
    std::deque<data::Quote> points_;
    std::recursive_mutex& mutex_;
};

} // namespace cache
} // namespace pricewatch
