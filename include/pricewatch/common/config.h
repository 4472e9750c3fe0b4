/**
 * Configuration management for the price service
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace pricewatch {
namespace common {

// Upstream data source (one entry of an ordered failover list)
struct SourceConfig {
    std::string name;
    std::string type;
    bool enabled = true;
    int timeout_s = 5;
};

// Circuit breaker thresholds shared by all sources
struct BreakerConfig {
    int max_fail_count = 3;
    int mute_duration_s = 60;
};

// Cache lifetimes
struct CacheConfig {
    int fund_fresh_ttl_s = 30;
    int fund_stale_ttl_s = 120;
    int holdings_fresh_ttl_s = 30;
    int holdings_stale_ttl_s = 300;
    int portfolio_ttl_s = 86400;
    int price_stale_threshold_s = 30;
};

// Price history and manual records retention
struct HistoryConfig {
    size_t capacity = 720;
    int records_keep_days = 7;
};

// Background poller cadence
struct PollerConfig {
    bool enabled = true;
    int interval_ms = 5000;
    int error_backoff_ms = 30000;
};

// Batch fetch worker pool
struct WorkerConfig {
    int max_fetch_workers = 5;
};

// Outbound HTTP settings
struct HttpConfig {
    std::string user_agent;
};

// Logging configuration
struct LoggingConfig {
    std::string level = "INFO";
    std::string file;
    int flush_interval_ms = 1000;
};

// State file location
struct StorageConfig {
    std::string data_file = "data/data.json";
};

class Config {
public:
    // Built-in defaults, no file
    Config();
    explicit Config(const std::string& config_path);
    ~Config() = default;

    // Parse YAML text (used by tests and embedded configs)
    static Config fromString(const std::string& yaml_text);

    const std::vector<SourceConfig>& getSources() const { return sources_; }
    const std::vector<SourceConfig>& getFundSources() const { return fund_sources_; }
    const BreakerConfig& getBreakerConfig() const { return breaker_config_; }
    const CacheConfig& getCacheConfig() const { return cache_config_; }
    const HistoryConfig& getHistoryConfig() const { return history_config_; }
    const PollerConfig& getPollerConfig() const { return poller_config_; }
    const WorkerConfig& getWorkerConfig() const { return worker_config_; }
    const HttpConfig& getHttpConfig() const { return http_config_; }
    const LoggingConfig& getLoggingConfig() const { return logging_config_; }
    const StorageConfig& getStorageConfig() const { return storage_config_; }

    // Command-line override
    void setLogLevel(const std::string& level) { logging_config_.level = level; }

private:
    void loadConfig(const YAML::Node& config);
    std::vector<SourceConfig> parseSources(const YAML::Node& node, const std::string& section);
    void validate() const;
    std::string expandEnvVars(const std::string& value);

    std::vector<SourceConfig> sources_;
    std::vector<SourceConfig> fund_sources_;
    BreakerConfig breaker_config_;
    CacheConfig cache_config_;
    HistoryConfig history_config_;
    PollerConfig poller_config_;
    WorkerConfig worker_config_;
    HttpConfig http_config_;
    LoggingConfig logging_config_;
    StorageConfig storage_config_;
};

// Sources used when the config file has no sources section
std::vector<SourceConfig> defaultGoldSources();
std::vector<SourceConfig> defaultFundSources();

} // namespace common
} // namespace pricewatch
