/**
 * Fetch adapter implementation
 */

#include <algorithm>
#include <chrono>
#include <sstream>
#include <nlohmann/json.hpp>

#include "pricewatch/common/logging.h"
#include "pricewatch/data/fetch_adapters.h"

using json = nlohmann::json;

namespace pricewatch {
namespace data {

namespace {

const char* GOLD_NAME = "Au99.99";
const char* NETEASE_INSTRUMENT = "118AU9999";

// Gold prices keep cents, fund NAVs keep four decimals
constexpr int GOLD_DECIMALS = 2;
constexpr int NAV_DECIMALS = 4;

// Timeout for Tencent's secondary full-quote request
constexpr int TENCENT_FULL_TIMEOUT_S = 2;

std::string trim(const std::string& text) {
    const char* whitespace = " \t\r\n";
    size_t start = text.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(start, end - start + 1);
}

std::vector<std::string> split(const std::string& text, char delimiter) {
    std::vector<std::string> parts;
    std::stringstream ss(text);
    std::string part;
    while (std::getline(ss, part, delimiter)) {
        parts.push_back(part);
    }
    // getline drops a trailing empty field
    if (!text.empty() && text.back() == delimiter) {
        parts.emplace_back();
    }
    return parts;
}

double parseNumber(const std::string& text, const std::string& field) {
    std::string value = trim(text);
    if (value.empty()) {
        throw AdapterError("empty value for " + field);
    }
    try {
        size_t consumed = 0;
        double result = std::stod(value, &consumed);
        if (consumed != value.size()) {
            throw AdapterError("invalid number for " + field + ": " + value);
        }
        return result;
    } catch (const std::logic_error&) {
        throw AdapterError("invalid number for " + field + ": " + value);
    }
}

// Empty text falls back instead of failing
double parseNumberOr(const std::string& text, double fallback, const std::string& field) {
    if (trim(text).empty()) {
        return fallback;
    }
    return parseNumber(text, field);
}

// Providers mix numeric and string encodings of the same field
double jsonNumber(const json& node, const std::string& field) {
    if (!node.contains(field) || node[field].is_null()) {
        throw AdapterError("missing field " + field);
    }
    const json& value = node[field];
    if (value.is_number()) {
        return value.get<double>();
    }
    if (value.is_string()) {
        return parseNumber(value.get<std::string>(), field);
    }
    throw AdapterError("unexpected type for " + field);
}

double jsonNumberOr(const json& node, const std::string& field, double fallback) {
    if (!node.contains(field) || node[field].is_null()) {
        return fallback;
    }
    return jsonNumber(node, field);
}

std::string jsonString(const json& node, const std::string& field) {
    if (!node.contains(field) || !node[field].is_string()) {
        return "";
    }
    return node[field].get<std::string>();
}

json parseJson(const std::string& text) {
    try {
        return json::parse(text);
    } catch (const json::parse_error& e) {
        throw AdapterError(std::string("malformed JSON: ") + e.what());
    }
}

void checkFundCode(const json& data, const std::string& field, const std::string& code) {
    std::string returned = jsonString(data, field);
    if (!returned.empty() && returned != code) {
        throw AdapterError("response is for fund " + returned + ", expected " + code);
    }
}

} // namespace

namespace parsers {

std::string extractQuoted(const std::string& text) {
    size_t open = text.find('"');
    if (open == std::string::npos) {
        throw AdapterError("no quoted payload");
    }
    size_t close = text.find('"', open + 1);
    if (close == std::string::npos) {
        throw AdapterError("unterminated quoted payload");
    }
    return text.substr(open + 1, close - open - 1);
}

std::string extractJsonp(const std::string& text) {
    size_t open = text.find('(');
    size_t close = text.rfind(')');
    if (open == std::string::npos || close == std::string::npos || close < open) {
        throw AdapterError("no JSONP payload");
    }
    return trim(text.substr(open + 1, close - open - 1));
}

Quote parseEastmoneyGold(const std::string& body) {
    json root = parseJson(body);
    if (!root.contains("data") || !root["data"].is_object()) {
        throw AdapterError("missing data object");
    }
    const json& data = root["data"];

    // All fields are integers in cents
    Quote quote;
    quote.name = GOLD_NAME;
    quote.price = roundTo(jsonNumberOr(data, "f43", 0.0) / 100.0, GOLD_DECIMALS);
    quote.high = roundTo(jsonNumberOr(data, "f44", 0.0) / 100.0, GOLD_DECIMALS);
    quote.low = roundTo(jsonNumberOr(data, "f45", 0.0) / 100.0, GOLD_DECIMALS);
    quote.open = roundTo(jsonNumberOr(data, "f46", 0.0) / 100.0, GOLD_DECIMALS);
    quote.prev_close = roundTo(jsonNumberOr(data, "f60", 0.0) / 100.0, GOLD_DECIMALS);
    quote.change = roundTo(quote.price - quote.prev_close, GOLD_DECIMALS);
    quote.change_percent = roundTo(jsonNumberOr(data, "f170", 0.0) / 100.0, GOLD_DECIMALS);
    return quote;
}

Quote parseSinaGold(const std::string& body) {
    std::vector<std::string> parts = split(extractQuoted(body), ',');
    if (parts.size() < 8) {
        throw AdapterError("expected at least 8 fields, got " + std::to_string(parts.size()));
    }

    Quote quote;
    quote.name = GOLD_NAME;
    quote.price = parseNumberOr(parts[1], 0.0, "price");
    quote.prev_close = parseNumberOr(parts[2], quote.price, "prev_close");
    quote.open = parseNumberOr(parts[3], quote.price, "open");
    quote.high = parseNumberOr(parts[4], quote.price, "high");
    quote.low = parseNumberOr(parts[5], quote.price, "low");

    double change = quote.price - quote.prev_close;
    quote.change_percent = roundTo(percentChange(change, quote.prev_close), GOLD_DECIMALS);
    quote.change = roundTo(change, GOLD_DECIMALS);
    quote.price = roundTo(quote.price, GOLD_DECIMALS);
    quote.prev_close = roundTo(quote.prev_close, GOLD_DECIMALS);
    quote.open = roundTo(quote.open, GOLD_DECIMALS);
    quote.high = roundTo(quote.high, GOLD_DECIMALS);
    quote.low = roundTo(quote.low, GOLD_DECIMALS);
    return quote;
}

Quote parseTencentShort(const std::string& body) {
    std::vector<std::string> parts = split(extractQuoted(body), '~');
    if (parts.size() < 6) {
        throw AdapterError("expected at least 6 fields, got " + std::to_string(parts.size()));
    }

    Quote quote;
    quote.name = GOLD_NAME;
    quote.price = roundTo(parseNumber(parts[3], "price"), GOLD_DECIMALS);
    quote.change = roundTo(parseNumber(parts[4], "change"), GOLD_DECIMALS);
    quote.change_percent = roundTo(parseNumber(parts[5], "change_percent"), GOLD_DECIMALS);

    // Until the full quote says otherwise
    quote.prev_close = roundTo(quote.price - quote.change, GOLD_DECIMALS);
    quote.open = quote.price;
    quote.high = quote.price;
    quote.low = quote.price;
    return quote;
}

bool applyTencentFull(const std::string& body, Quote& quote) {
    std::vector<std::string> fields = split(extractQuoted(body), '~');
    if (fields.size() <= 34) {
        return false;
    }

    quote.prev_close = roundTo(parseNumberOr(fields[4], quote.prev_close, "prev_close"), GOLD_DECIMALS);
    quote.open = roundTo(parseNumberOr(fields[5], quote.open, "open"), GOLD_DECIMALS);
    quote.high = roundTo(parseNumberOr(fields[33], quote.high, "high"), GOLD_DECIMALS);
    quote.low = roundTo(parseNumberOr(fields[34], quote.low, "low"), GOLD_DECIMALS);
    return true;
}

Quote parseNeteaseGold(const std::string& body, const std::string& instrument) {
    json root = parseJson(extractJsonp(body));
    if (!root.contains(instrument) || !root[instrument].is_object()) {
        throw AdapterError("missing instrument " + instrument);
    }
    const json& data = root[instrument];

    Quote quote;
    quote.name = GOLD_NAME;
    quote.price = jsonNumberOr(data, "price", 0.0);
    quote.open = jsonNumberOr(data, "open", quote.price);
    quote.high = jsonNumberOr(data, "high", quote.price);
    quote.low = jsonNumberOr(data, "low", quote.price);
    quote.prev_close = jsonNumberOr(data, "yestclose", quote.price);
    quote.change = jsonNumberOr(data, "updown", 0.0);

    // NetEase reports percent as a fraction
    quote.change_percent = roundTo(jsonNumberOr(data, "percent", 0.0) * 100.0, GOLD_DECIMALS);

    quote.price = roundTo(quote.price, GOLD_DECIMALS);
    quote.open = roundTo(quote.open, GOLD_DECIMALS);
    quote.high = roundTo(quote.high, GOLD_DECIMALS);
    quote.low = roundTo(quote.low, GOLD_DECIMALS);
    quote.prev_close = roundTo(quote.prev_close, GOLD_DECIMALS);
    quote.change = roundTo(quote.change, GOLD_DECIMALS);
    return quote;
}

Quote parseFundEstimate(const std::string& body, const std::string& code) {
    std::string payload = extractJsonp(body);
    if (payload.empty()) {
        throw AdapterError("no estimate published for " + code);
    }
    json data = parseJson(payload);
    checkFundCode(data, "fundcode", code);

    Quote quote;
    quote.code = code;
    quote.name = jsonString(data, "name");
    quote.price = roundTo(jsonNumber(data, "gsz"), NAV_DECIMALS);
    quote.prev_close = roundTo(jsonNumberOr(data, "dwjz", quote.price), NAV_DECIMALS);
    quote.change = roundTo(quote.price - quote.prev_close, NAV_DECIMALS);
    quote.change_percent = roundTo(jsonNumberOr(data, "gszzl", 0.0), GOLD_DECIMALS);
    quote.open = quote.price;
    quote.high = quote.price;
    quote.low = quote.price;
    quote.time_str = jsonString(data, "gztime");
    return quote;
}

Quote parseFundNav(const std::string& body, const std::string& code) {
    json root = parseJson(body);
    if (!root.contains("Datas") || !root["Datas"].is_object()) {
        throw AdapterError("missing Datas object");
    }
    const json& data = root["Datas"];
    checkFundCode(data, "FCODE", code);

    Quote quote;
    quote.code = code;
    quote.name = jsonString(data, "SHORTNAME");
    double nav = jsonNumber(data, "DWJZ");
    double percent = jsonNumberOr(data, "RZDF", 0.0);

    // Previous NAV implied by the daily growth rate
    double prev = (percent > -100.0) ? nav / (1.0 + percent / 100.0) : nav;

    quote.price = roundTo(nav, NAV_DECIMALS);
    quote.prev_close = roundTo(prev, NAV_DECIMALS);
    quote.change = roundTo(nav - prev, NAV_DECIMALS);
    quote.change_percent = roundTo(percent, GOLD_DECIMALS);
    quote.open = quote.price;
    quote.high = quote.price;
    quote.low = quote.price;
    quote.time_str = jsonString(data, "FSRQ");
    return quote;
}

} // namespace parsers

// HttpQuoteAdapter implementation
HttpQuoteAdapter::HttpQuoteAdapter(HttpClient& http, const common::Clock& clock)
    : http_(http), clock_(clock) {
}

std::optional<Quote> HttpQuoteAdapter::fetch(const SourceDescriptor& source, const std::string& key) {
    try {
        Quote quote = fetchQuote(source, key);
        if (!quote.isValid()) {
            LOG_WARNING("[" + source.name + "] discarded quote with non-positive price");
            return std::nullopt;
        }

        double now = clock_.now();
        quote.timestamp = now;
        if (quote.time_str.empty()) {
            quote.time_str = common::formatLocalTime(now, "%H:%M:%S");
        }
        if (quote.code.empty()) {
            quote.code = key;
        }
        quote.source = source.name;
        return quote;
    } catch (const std::exception& e) {
        LOG_WARNING("[" + source.name + "] fetch failed: " + e.what());
        return std::nullopt;
    }
}

std::string HttpQuoteAdapter::getBody(const std::string& url, int timeout_s,
                                      const std::vector<std::string>& headers) {
    HttpRequest request;
    request.url = url;
    request.headers = headers;
    request.timeout_s = timeout_s;
    return http_.get(request).body;
}

// Provider adapters
Quote EastmoneyGoldAdapter::fetchQuote(const SourceDescriptor& source, const std::string& /*key*/) {
    std::string body = getBody(
        "https://push2.eastmoney.com/api/qt/stock/get?secid=118.AU9999&fields=f43,f44,f45,f46,f60,f170",
        source.timeout_s);
    return parsers::parseEastmoneyGold(body);
}

Quote SinaGoldAdapter::fetchQuote(const SourceDescriptor& source, const std::string& /*key*/) {
    std::string body = getBody("https://hq.sinajs.cn/list=gds_au9999", source.timeout_s,
                               {"Referer: https://finance.sina.com.cn"});
    return parsers::parseSinaGold(body);
}

Quote TencentGoldAdapter::fetchQuote(const SourceDescriptor& source, const std::string& /*key*/) {
    Quote quote = parsers::parseTencentShort(getBody("http://qt.gtimg.cn/q=s_shau9999", source.timeout_s));

    // Enrichment only; the short quote stands on its own
    try {
        std::string full = getBody("http://qt.gtimg.cn/q=shau9999",
                                   std::min(source.timeout_s, TENCENT_FULL_TIMEOUT_S));
        if (!parsers::applyTencentFull(full, quote)) {
            LOG_DEBUG("[" + source.name + "] full quote too short, keeping derived prev_close");
        }
    } catch (const std::exception& e) {
        LOG_DEBUG("[" + source.name + "] full quote unavailable: " + e.what());
    }
    return quote;
}

Quote NeteaseGoldAdapter::fetchQuote(const SourceDescriptor& source, const std::string& /*key*/) {
    std::string body = getBody("http://api.money.126.net/data/feed/118AU9999,money.api",
                               source.timeout_s);
    return parsers::parseNeteaseGold(body, NETEASE_INSTRUMENT);
}

Quote FundEstimateAdapter::fetchQuote(const SourceDescriptor& source, const std::string& key) {
    if (key.empty()) {
        throw AdapterError("fund code required");
    }
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    std::string body = getBody("http://fundgz.1234567.com.cn/js/" + key + ".js?rt=" + std::to_string(ms),
                               source.timeout_s);
    return parsers::parseFundEstimate(body, key);
}

Quote FundNavAdapter::fetchQuote(const SourceDescriptor& source, const std::string& key) {
    if (key.empty()) {
        throw AdapterError("fund code required");
    }
    std::string body = getBody(
        "https://fundmobapi.eastmoney.com/FundMApi/FundBaseTypeInformation.ashx?FCODE=" + key +
            "&deviceid=Wap&plat=Wap&product=EFund&version=2.0.0",
        source.timeout_s);
    return parsers::parseFundNav(body, key);
}

AdapterMap makeGoldAdapters(HttpClient& http, const common::Clock& clock) {
    AdapterMap adapters;
    adapters["eastmoney"] = std::make_shared<EastmoneyGoldAdapter>(http, clock);
    adapters["sina"] = std::make_shared<SinaGoldAdapter>(http, clock);
    adapters["tencent"] = std::make_shared<TencentGoldAdapter>(http, clock);
    adapters["netease"] = std::make_shared<NeteaseGoldAdapter>(http, clock);
    return adapters;
}

AdapterMap makeFundAdapters(HttpClient& http, const common::Clock& clock) {
    AdapterMap adapters;
    adapters["fundgz"] = std::make_shared<FundEstimateAdapter>(http, clock);
    adapters["fund_nav"] = std::make_shared<FundNavAdapter>(http, clock);
    return adapters;
}

} // namespace data
} // namespace pricewatch
