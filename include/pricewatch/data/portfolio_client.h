/**
 * Fund portfolio (top stock positions) client
 */

#pragma once

#include <optional>
#include <string>

#include "pricewatch/common/clock.h"
#include "pricewatch/data/http_client.h"
#include "pricewatch/data/records.h"

namespace pricewatch {
namespace data {

class PortfolioSource {
public:
    virtual ~PortfolioSource() = default;

    // Latest disclosed positions for a fund; nullopt on any failure
    virtual std::optional<FundPortfolio> fetch(const std::string& code) = 0;
};

// EastMoney mobile position endpoint
class EastmoneyPortfolioClient : public PortfolioSource {
public:
    EastmoneyPortfolioClient(HttpClient& http, const common::Clock& clock, int timeout_s = 5);

    std::optional<FundPortfolio> fetch(const std::string& code) override;

private:
    HttpClient& http_;
    const common::Clock& clock_;
    int timeout_s_;
};

namespace parsers {

// Throws AdapterError on malformed payloads; fetched_at is left at 0
FundPortfolio parsePortfolio(const std::string& body, const std::string& code);

} // namespace parsers

} // namespace data
} // namespace pricewatch
