/**
 * Quote helpers
 */

#include <cmath>

#include "pricewatch/data/quote.h"

namespace pricewatch {
namespace data {

double roundTo(double value, int decimals) {
    double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

double percentChange(double change, double prev_close) {
    if (prev_close == 0.0) {
        return 0.0;
    }
    return change / prev_close * 100.0;
}

void annotateSource(Quote& quote, const std::string& marker) {
    if (quote.source.find(marker) == std::string::npos) {
        quote.source += marker;
    }
}

} // namespace data
} // namespace pricewatch
