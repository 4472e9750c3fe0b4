/**
 * Wall-clock abstraction and local-time helpers
 */

#pragma once

#include <string>

namespace pricewatch {
namespace common {

// Source of "now" in epoch seconds; injected so TTLs and mute windows are testable
class Clock {
public:
    virtual ~Clock() = default;
    virtual double now() const = 0;
};

class SystemClock : public Clock {
public:
    double now() const override;
};

// Epoch seconds of local midnight for the day containing timestamp
double localDayStart(double timestamp);

// strftime-style formatting of timestamp in local time
std::string formatLocalTime(double timestamp, const char* format);

} // namespace common
} // namespace pricewatch
