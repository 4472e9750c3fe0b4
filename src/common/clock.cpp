/**
 * Clock implementation
 */

#include <chrono>
#include <cmath>
#include <ctime>

#include "pricewatch/common/clock.h"

namespace pricewatch {
namespace common {

double SystemClock::now() const {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::duration<double>>(now.time_since_epoch()).count();
}

double localDayStart(double timestamp) {
    std::time_t seconds = static_cast<std::time_t>(std::floor(timestamp));
    std::tm local_tm{};
    localtime_r(&seconds, &local_tm);

    local_tm.tm_hour = 0;
    local_tm.tm_min = 0;
    local_tm.tm_sec = 0;
    local_tm.tm_isdst = -1;
    return static_cast<double>(std::mktime(&local_tm));
}

std::string formatLocalTime(double timestamp, const char* format) {
    std::time_t seconds = static_cast<std::time_t>(std::floor(timestamp));
    std::tm local_tm{};
    localtime_r(&seconds, &local_tm);

    char buffer[64];
    size_t written = std::strftime(buffer, sizeof(buffer), format, &local_tm);
    return std::string(buffer, written);
}

} // namespace common
} // namespace pricewatch
