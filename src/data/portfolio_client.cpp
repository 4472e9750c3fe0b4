/**
 * Fund portfolio client implementation
 */

#include <nlohmann/json.hpp>

#include "pricewatch/common/logging.h"
#include "pricewatch/data/fetch_adapters.h"
#include "pricewatch/data/portfolio_client.h"

using json = nlohmann::json;

namespace pricewatch {
namespace data {

namespace parsers {

FundPortfolio parsePortfolio(const std::string& body, const std::string& code) {
    json root;
    try {
        root = json::parse(body);
    } catch (const json::parse_error& e) {
        throw AdapterError(std::string("malformed JSON: ") + e.what());
    }

    if (!root.contains("Datas") || !root["Datas"].is_object()) {
        throw AdapterError("missing Datas object for fund " + code);
    }

    FundPortfolio portfolio;
    portfolio.code = code;
    if (root.contains("Expansion") && root["Expansion"].is_string()) {
        portfolio.report_period = root["Expansion"].get<std::string>();
    }

    const json& datas = root["Datas"];
    if (!datas.contains("fundStocks") || !datas["fundStocks"].is_array()) {
        // Bond and money funds disclose no stocks
        return portfolio;
    }

    for (const auto& item : datas["fundStocks"]) {
        StockPosition position;
        position.code = item.value("GPDM", "");
        position.name = item.value("GPJC", "");

        if (item.contains("JZBL")) {
            const json& weight = item["JZBL"];
            try {
                if (weight.is_number()) {
                    position.weight = weight.get<double>();
                } else if (weight.is_string() && !weight.get<std::string>().empty()) {
                    position.weight = std::stod(weight.get<std::string>());
                }
            } catch (const std::logic_error&) {
                throw AdapterError("invalid weight for " + position.code);
            }
        }

        if (!position.code.empty()) {
            portfolio.positions.push_back(position);
        }
    }
    return portfolio;
}

} // namespace parsers

EastmoneyPortfolioClient::EastmoneyPortfolioClient(HttpClient& http, const common::Clock& clock, int timeout_s)
    : http_(http), clock_(clock), timeout_s_(timeout_s) {
}

std::optional<FundPortfolio> EastmoneyPortfolioClient::fetch(const std::string& code) {
    HttpRequest request;
    request.url = "https://fundmobapi.eastmoney.com/FundMNewApi/FundMNInverstPosition?FCODE=" + code +
                  "&deviceid=Wap&plat=Wap&product=EFund&version=2.0.0";
    request.timeout_s = timeout_s_;

    try {
        FundPortfolio portfolio = parsers::parsePortfolio(http_.get(request).body, code);
        portfolio.fetched_at = clock_.now();
        return portfolio;
    } catch (const std::exception& e) {
        LOG_WARNING("Portfolio fetch failed for " + code + ": " + e.what());
        return std::nullopt;
    }
}

} // namespace data
} // namespace pricewatch
