/**
 * Ring-buffer logging for the price service
 */

#pragma once

#include <array>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>
#include <thread>

namespace pricewatch {
namespace common {

struct LoggingConfig;

// Log levels
enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

// One ring slot, reused in place
struct LogEntry {
    uint64_t wall_ns;
    LogLevel level;
    uint32_t thread_id;
    char message[512];
};

/**
 * Logger with a fixed ring of entries drained by a background flush thread.
 * Writes to stderr until configure() points it at a file.
 */
class RingBufferLogger {
public:
    explicit RingBufferLogger(LogLevel level = LogLevel::INFO);
    ~RingBufferLogger();

    RingBufferLogger(const RingBufferLogger&) = delete;
    RingBufferLogger& operator=(const RingBufferLogger&) = delete;

    // Apply level, output file and flush interval
    void configure(const LoggingConfig& config);

    // Queue a message; oldest unflushed entries are overwritten when the ring is full
    void log(LogLevel level, const std::string& message);

    // Set log level
    void setLevel(const std::string& level_str);
    void setLevel(LogLevel level);
    LogLevel getLevel() const { return level_.load(); }

    // Write pending entries to the output
    void flush();

    // Number of entries dropped because the ring overflowed
    uint64_t droppedCount() const { return dropped_.load(); }

    static LogLevel stringToLogLevel(const std::string& level_str);
    static const char* logLevelToString(LogLevel level);

private:
    static constexpr size_t BUFFER_SIZE = 2048;
    std::array<LogEntry, BUFFER_SIZE> buffer_;
    uint64_t write_index_ = 0;
    uint64_t read_index_ = 0;
    std::mutex buffer_mutex_;

    std::atomic<LogLevel> level_;
    std::atomic<uint64_t> dropped_{0};

    // Output file, empty path means stderr
    std::mutex output_mutex_;
    std::ofstream file_;

    // Drains the ring every flush_interval_ms_
    std::thread flush_thread_;
    std::atomic<bool> running_{true};
    std::atomic<int> flush_interval_ms_{1000};
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;

    void drainLoop();
    void writeEntry(std::ostream& out, const LogEntry& entry);
    static uint64_t wallClockNanos();
};

// Process-wide logger used by the LOG_* macros
extern RingBufferLogger g_logger;

#define LOG_DEBUG(message) ::pricewatch::common::g_logger.log(::pricewatch::common::LogLevel::DEBUG, message)
#define LOG_INFO(message) ::pricewatch::common::g_logger.log(::pricewatch::common::LogLevel::INFO, message)
#define LOG_WARNING(message) ::pricewatch::common::g_logger.log(::pricewatch::common::LogLevel::WARNING, message)
#define LOG_ERROR(message) ::pricewatch::common::g_logger.log(::pricewatch::common::LogLevel::ERROR, message)
#define LOG_CRITICAL(message) ::pricewatch::common::g_logger.log(::pricewatch::common::LogLevel::CRITICAL, message)

} // namespace common
} // namespace pricewatch
