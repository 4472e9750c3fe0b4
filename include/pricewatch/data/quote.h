/**
 * Normalized quote structure
 */

#pragma once

#include <string>

namespace pricewatch {
namespace data {

// Price snapshot from one provider at one point in time
struct Quote {
    std::string code;          // Fund code, empty for commodity quotes
    std::string name;
    double price = 0.0;
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double prev_close = 0.0;
    double change = 0.0;
    double change_percent = 0.0;
    double timestamp = 0.0;    // Seconds since epoch
    std::string time_str;      // Local capture time
    std::string source;        // Provider name, possibly with a cache marker

    // Non-positive prices are never served
    bool isValid() const { return price > 0.0; }
};

// Cache annotations appended to Quote::source
constexpr const char* STALE_MARKER = "(cached)";
constexpr const char* EXPIRED_MARKER = "(expired)";
constexpr const char* ERROR_SOURCE = "Error";

// Round half away from zero to the given number of decimals
double roundTo(double value, int decimals);

// change / prev_close * 100, 0 when prev_close is 0
double percentChange(double change, double prev_close);

// Append marker to source unless it is already present
void annotateSource(Quote& quote, const std::string& marker);

} // namespace data
} // namespace pricewatch
