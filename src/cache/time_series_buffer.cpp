/**
 * Time-series buffer implementation
 */

#include <algorithm>
#include <stdexcept>

#include "pricewatch/cache/time_series_buffer.h"

namespace pricewatch {
namespace cache {

TimeSeriesBuffer::TimeSeriesBuffer(size_t capacity, std::recursive_mutex& mutex)
    : capacity_(capacity), mutex_(mutex) {
    if (capacity_ == 0) {
        throw std::invalid_argument("TimeSeriesBuffer capacity must be positive");
    }
}

void TimeSeriesBuffer::append(const data::Quote& quote) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (points_.size() >= capacity_) {
        points_.pop_front();
    }
    points_.push_back(quote);
}

void TimeSeriesBuffer::assign(const std::vector<data::Quote>& quotes) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    size_t skip = quotes.size() > capacity_ ? quotes.size() - capacity_ : 0;
    points_.assign(quotes.begin() + static_cast<std::ptrdiff_t>(skip), quotes.end());
}

size_t TimeSeriesBuffer::pruneBefore(double cutoff) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    size_t before = points_.size();
    points_.erase(std::remove_if(points_.begin(), points_.end(),
                                 [cutoff](const data::Quote& q) { return q.timestamp < cutoff; }),
                  points_.end());
    return before - points_.size();
}

std::vector<data::Quote> TimeSeriesBuffer::snapshot() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return std::vector<data::Quote>(points_.begin(), points_.end());
}

std::optional<data::Quote> TimeSeriesBuffer::latest() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (points_.empty()) {
        return std::nullopt;
    }
    return points_.back();
}

size_t TimeSeriesBuffer::size() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return points_.size();
}

bool TimeSeriesBuffer::empty() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return points_.empty();
}

} // namespace cache
} // namespace pricewatch
