/**
 * Configuration management implementation
 */

#include <cstddef>
#include <cstdlib>
#include <regex>
#include <stdexcept>
#include <unordered_set>

#include <yaml-cpp/yaml.h>
#include "pricewatch/common/config.h"
#include "pricewatch/common/logging.h"

namespace pricewatch {
namespace common {

namespace {

const char* const DEFAULT_USER_AGENT =
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
    "(KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36";

} // namespace

std::vector<SourceConfig> defaultGoldSources() {
    return {
        {"EastMoney", "eastmoney", true, 5},
        {"Sina Finance", "sina", true, 5},
        {"Tencent Finance", "tencent", true, 3},
        {"NetEase Finance", "netease", true, 3},
    };
}

std::vector<SourceConfig> defaultFundSources() {
    return {
        {"EastMoney Estimate", "fundgz", true, 5},
        {"EastMoney NAV", "fund_nav", true, 5},
    };
}

Config::Config()
    : sources_(defaultGoldSources()),
      fund_sources_(defaultFundSources()) {
    http_config_.user_agent = DEFAULT_USER_AGENT;
}

Config::Config(const std::string& config_path)
    : Config() {
    try {
        loadConfig(YAML::LoadFile(config_path));
    } catch (const std::exception& e) {
        throw std::runtime_error("Error loading config " + config_path + ": " + std::string(e.what()));
    }

    LOG_INFO("Configuration loaded from " + config_path);
}

Config Config::fromString(const std::string& yaml_text) {
    Config config;
    try {
        config.loadConfig(YAML::Load(yaml_text));
    } catch (const std::exception& e) {
        throw std::runtime_error("Error loading config: " + std::string(e.what()));
    }
    return config;
}

void Config::loadConfig(const YAML::Node& config) {
    if (!config || config.IsNull()) {
        validate();
        return;
    }

    // Parse data sources, list order is failover priority
    if (config["sources"]) {
        sources_ = parseSources(config["sources"], "sources");
    }
    if (config["fund_sources"]) {
        fund_sources_ = parseSources(config["fund_sources"], "fund_sources");
    }

    // Parse breaker configuration
    if (config["breaker"]) {
        auto breaker = config["breaker"];
        breaker_config_.max_fail_count = breaker["max_fail_count"].as<int>(3);
        breaker_config_.mute_duration_s = breaker["mute_duration_s"].as<int>(60);
    }

    // Parse cache configuration
    if (config["cache"]) {
        auto cache = config["cache"];
        cache_config_.fund_fresh_ttl_s = cache["fund_fresh_ttl_s"].as<int>(30);
        cache_config_.fund_stale_ttl_s = cache["fund_stale_ttl_s"].as<int>(120);
        cache_config_.holdings_fresh_ttl_s = cache["holdings_fresh_ttl_s"].as<int>(30);
        cache_config_.holdings_stale_ttl_s = cache["holdings_stale_ttl_s"].as<int>(300);
        cache_config_.portfolio_ttl_s = cache["portfolio_ttl_s"].as<int>(86400);
        cache_config_.price_stale_threshold_s = cache["price_stale_threshold_s"].as<int>(30);
    }

    // Parse history configuration
    if (config["history"]) {
        auto history = config["history"];
        history_config_.capacity = history["capacity"].as<size_t>(720);
        history_config_.records_keep_days = history["records_keep_days"].as<int>(7);
    }

    // Parse poller configuration
    if (config["poller"]) {
        auto poller = config["poller"];
        poller_config_.enabled = poller["enabled"].as<bool>(true);
        poller_config_.interval_ms = poller["interval_ms"].as<int>(5000);
        poller_config_.error_backoff_ms = poller["error_backoff_ms"].as<int>(30000);
    }

    if (config["workers"]) {
        worker_config_.max_fetch_workers = config["workers"]["max_fetch_workers"].as<int>(5);
    }

    if (config["http"]) {
        http_config_.user_agent = config["http"]["user_agent"].as<std::string>(DEFAULT_USER_AGENT);
    }

    // Parse logging configuration
    if (config["logging"]) {
        auto log = config["logging"];
        logging_config_.level = log["level"].as<std::string>("INFO");
        logging_config_.file = expandEnvVars(log["file"].as<std::string>(""));
        logging_config_.flush_interval_ms = log["flush_interval_ms"].as<int>(1000);
    }

    if (config["storage"]) {
        storage_config_.data_file = expandEnvVars(
            config["storage"]["data_file"].as<std::string>("data/data.json"));
    }

    validate();
}

std::vector<SourceConfig> Config::parseSources(const YAML::Node& node, const std::string& section) {
    if (!node.IsSequence()) {
        throw std::runtime_error(section + " must be a list");
    }

    std::vector<SourceConfig> sources;
    std::unordered_set<std::string> names;
    for (const auto& item : node) {
        SourceConfig source;
        source.name = item["name"].as<std::string>("");
        source.type = item["type"].as<std::string>("");
        source.enabled = item["enabled"].as<bool>(true);
        source.timeout_s = item["timeout_s"].as<int>(5);

        if (source.name.empty()) {
            throw std::runtime_error(section + ": source name must be specified");
        }
        if (source.type.empty()) {
            throw std::runtime_error(section + ": source " + source.name + " has no type");
        }
        if (source.timeout_s <= 0) {
            throw std::runtime_error(section + ": timeout for " + source.name + " must be positive");
        }
        if (!names.insert(source.name).second) {
            throw std::runtime_error(section + ": duplicate source name " + source.name);
        }
        sources.push_back(source);
    }

    if (sources.empty()) {
        LOG_WARNING("No entries configured in " + section);
    }
    return sources;
}

void Config::validate() const {
    if (breaker_config_.max_fail_count < 1) {
        throw std::runtime_error("breaker: max_fail_count must be at least 1");
    }
    if (breaker_config_.mute_duration_s < 0) {
        throw std::runtime_error("breaker: mute_duration_s must not be negative");
    }
    if (cache_config_.fund_fresh_ttl_s < 0 || cache_config_.fund_stale_ttl_s < cache_config_.fund_fresh_ttl_s) {
        throw std::runtime_error("cache: fund_stale_ttl_s must be >= fund_fresh_ttl_s >= 0");
    }
    if (cache_config_.holdings_fresh_ttl_s < 0 ||
        cache_config_.holdings_stale_ttl_s < cache_config_.holdings_fresh_ttl_s) {
        throw std::runtime_error("cache: holdings_stale_ttl_s must be >= holdings_fresh_ttl_s >= 0");
    }
    if (history_config_.capacity == 0) {
        throw std::runtime_error("history: capacity must be positive");
    }
    if (poller_config_.interval_ms <= 0 || poller_config_.error_backoff_ms <= 0) {
        throw std::runtime_error("poller: intervals must be positive");
    }
    if (worker_config_.max_fetch_workers < 1) {
        throw std::runtime_error("workers: max_fetch_workers must be at least 1");
    }
    if (storage_config_.data_file.empty()) {
        throw std::runtime_error("storage: data_file must be specified");
    }
}

std::string Config::expandEnvVars(const std::string& value) {
    // If the value doesn't contain any environment variables, return it as is
    if (value.find("${") == std::string::npos) {
        return value;
    }

    std::string result = value;
    std::regex env_var_pattern("\\$\\{([^}]+)\\}");

    // Substituted text is not scanned again
    std::smatch match;
    size_t search_from = 0;
    while (std::regex_search(result.cbegin() + static_cast<std::ptrdiff_t>(search_from), result.cend(),
                             match, env_var_pattern)) {
        std::string env_var_name = match[1].str();
        const char* env_var_value = std::getenv(env_var_name.c_str());
        if (!env_var_value) {
            LOG_WARNING("Environment variable " + env_var_name + " is not set");
        }

        std::string replacement = env_var_value ? env_var_value : "";
        size_t match_start = search_from + static_cast<size_t>(match.position(0));
        result.replace(match_start, static_cast<size_t>(match.length(0)), replacement);
        search_from = match_start + replacement.size();
    }

    return result;
}

} // namespace common
} // namespace pricewatch
