/**
 * Provider-specific fetch adapters producing normalized quotes
 */

#pragma once

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "pricewatch/common/clock.h"
#include "pricewatch/data/http_client.h"
#include "pricewatch/data/quote.h"
#include "pricewatch/data/source_registry.h"

namespace pricewatch {
namespace data {

// Network, parse or invalid-data failure inside an adapter
class AdapterError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class QuoteAdapter {
public:
    virtual ~QuoteAdapter() = default;

    // One quote for key (empty for commodity sources); nullopt on any failure, never throws
    virtual std::optional<Quote> fetch(const SourceDescriptor& source, const std::string& key) = 0;
};

// Adapters by provider type
using AdapterMap = std::unordered_map<std::string, std::shared_ptr<QuoteAdapter>>;

/**
 * Adapter boundary for HTTP providers: subclasses fetch and parse and may
 * throw; fetch() converts every failure and every non-positive price into
 * an empty result and stamps capture time and source name.
 */
class HttpQuoteAdapter : public QuoteAdapter {
public:
    HttpQuoteAdapter(HttpClient& http, const common::Clock& clock);

    std::optional<Quote> fetch(const SourceDescriptor& source, const std::string& key) final;

protected:
    virtual Quote fetchQuote(const SourceDescriptor& source, const std::string& key) = 0;

    std::string getBody(const std::string& url, int timeout_s,
                        const std::vector<std::string>& headers = {});

    HttpClient& http_;
    const common::Clock& clock_;
};

// Au99.99 from EastMoney push API, prices in cents
class EastmoneyGoldAdapter : public HttpQuoteAdapter {
public:
    using HttpQuoteAdapter::HttpQuoteAdapter;

protected:
    Quote fetchQuote(const SourceDescriptor& source, const std::string& key) override;
};

// Au99.99 from Sina, comma-delimited quoted string
class SinaGoldAdapter : public HttpQuoteAdapter {
public:
    using HttpQuoteAdapter::HttpQuoteAdapter;

protected:
    Quote fetchQuote(const SourceDescriptor& source, const std::string& key) override;
};

// Au99.99 from Tencent, tilde-delimited short quote enriched by the full quote
class TencentGoldAdapter : public HttpQuoteAdapter {
public:
    using HttpQuoteAdapter::HttpQuoteAdapter;

protected:
    Quote fetchQuote(const SourceDescriptor& source, const std::string& key) override;
};

// Au99.99 from NetEase, JSONP object
class NeteaseGoldAdapter : public HttpQuoteAdapter {
public:
    using HttpQuoteAdapter::HttpQuoteAdapter;

protected:
    Quote fetchQuote(const SourceDescriptor& source, const std::string& key) override;
};

// Intraday fund NAV estimate (fundgz JSONP)
class FundEstimateAdapter : public HttpQuoteAdapter {
public:
    using HttpQuoteAdapter::HttpQuoteAdapter;

protected:
    Quote fetchQuote(const SourceDescriptor& source, const std::string& key) override;
};

// Last published fund NAV (EastMoney mobile API)
class FundNavAdapter : public HttpQuoteAdapter {
public:
    using HttpQuoteAdapter::HttpQuoteAdapter;

protected:
    Quote fetchQuote(const SourceDescriptor& source, const std::string& key) override;
};

// Built-in adapters keyed by SourceConfig::type
AdapterMap makeGoldAdapters(HttpClient& http, const common::Clock& clock);
AdapterMap makeFundAdapters(HttpClient& http, const common::Clock& clock);

/**
 * Payload parsers. Each throws AdapterError on malformed input and leaves
 * timestamp and source unset.
 */
namespace parsers {

// Text between the first pair of double quotes
std::string extractQuoted(const std::string& text);

// Text between the first '(' and the last ')'
std::string extractJsonp(const std::string& text);

Quote parseEastmoneyGold(const std::string& body);
Quote parseSinaGold(const std::string& body);
Quote parseTencentShort(const std::string& body);

// Fill prev_close/open/high/low from the full quote; false if it has too few fields
bool applyTencentFull(const std::string& body, Quote& quote);

Quote parseNeteaseGold(const std::string& body, const std::string& instrument);
Quote parseFundEstimate(const std::string& body, const std::string& code);
Quote parseFundNav(const std::string& body, const std::string& code);

} // namespace parsers

} // namespace data
} // namespace pricewatch
