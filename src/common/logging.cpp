/**
 * Ring-buffer logging implementation
 */

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstring>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <utility>
#include <vector>

#include "pricewatch/common/config.h"
#include "pricewatch/common/logging.h"

namespace pricewatch {
namespace common {

RingBufferLogger g_logger;

RingBufferLogger::RingBufferLogger(LogLevel level)
    : level_(level) {
    flush_thread_ = std::thread(&RingBufferLogger::drainLoop, this);
}

RingBufferLogger::~RingBufferLogger() {
    running_ = false;
    wait_cv_.notify_all();

    if (flush_thread_.joinable()) {
        flush_thread_.join();
    }

    // Entries queued after the last drain
    flush();

    std::lock_guard<std::mutex> lock(output_mutex_);
    if (file_.is_open()) {
        file_.close();
    }
}

void RingBufferLogger::configure(const LoggingConfig& config) {
    setLevel(config.level);
    if (config.flush_interval_ms > 0) {
        flush_interval_ms_ = config.flush_interval_ms;
    }

    // Drain whatever was logged before the file was chosen
    flush();

    std::lock_guard<std::mutex> lock(output_mutex_);
    if (file_.is_open()) {
        file_.close();
    }
    if (!config.file.empty()) {
        file_.open(config.file, std::ios::out | std::ios::app);
        if (!file_.is_open()) {
            std::cerr << "Failed to open log file " << config.file
                      << ", logging to stderr" << std::endl;
        }
    }
}

void RingBufferLogger::log(LogLevel level, const std::string& message) {
    if (level < level_.load()) {
        return;
    }

    std::lock_guard<std::mutex> lock(buffer_mutex_);

    if (write_index_ - read_index_ >= BUFFER_SIZE) {
        // Ring full, overwrite the oldest pending entry
        ++read_index_;
        ++dropped_;
    }

    LogEntry& slot = buffer_[write_index_ % BUFFER_SIZE];
    slot.wall_ns = wallClockNanos();
    slot.level = level;
    slot.thread_id = static_cast<uint32_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));

    // Long messages are cut at the slot size
    size_t length = std::min(message.size(), sizeof(slot.message) - 1);
    std::memcpy(slot.message, message.data(), length);
    slot.message[length] = '\0';

    ++write_index_;
}

void RingBufferLogger::setLevel(const std::string& level_str) {
    level_ = stringToLogLevel(level_str);
}

void RingBufferLogger::setLevel(LogLevel level) {
    level_ = level;
}

void RingBufferLogger::flush() {
    // Copy pending entries out so writers are not blocked on I/O
    std::vector<LogEntry> pending;
    {
        std::lock_guard<std::mutex> lock(buffer_mutex_);
        pending.reserve(static_cast<size_t>(write_index_ - read_index_));
        while (read_index_ < write_index_) {
            pending.push_back(buffer_[read_index_ % BUFFER_SIZE]);
            ++read_index_;
        }
    }

    if (pending.empty()) {
        return;
    }

    std::lock_guard<std::mutex> lock(output_mutex_);
    std::ostream& out = file_.is_open() ? static_cast<std::ostream&>(file_) : std::cerr;
    for (const auto& entry : pending) {
        writeEntry(out, entry);
    }
    out.flush();
}

void RingBufferLogger::writeEntry(std::ostream& out, const LogEntry& entry) {
    const uint64_t millis_total = entry.wall_ns / 1000000ULL;
    std::time_t seconds = static_cast<std::time_t>(millis_total / 1000ULL);
    std::tm parts{};
    localtime_r(&seconds, &parts);

    out << std::put_time(&parts, "%Y-%m-%d %H:%M:%S")
        << "." << std::setfill('0') << std::setw(3) << (millis_total % 1000ULL)
        << " [" << logLevelToString(entry.level) << "] "
        << "[" << entry.thread_id << "] "
        << entry.message << '\n';
}

LogLevel RingBufferLogger::stringToLogLevel(const std::string& level_str) {
    std::string name(level_str);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    static const std::pair<const char*, LogLevel> kLevels[] = {
        {"debug", LogLevel::DEBUG},
        {"info", LogLevel::INFO},
        {"warning", LogLevel::WARNING},
        {"warn", LogLevel::WARNING},
        {"error", LogLevel::ERROR},
        {"critical", LogLevel::CRITICAL},
    };
    for (const auto& level : kLevels) {
        if (name == level.first) {
            return level.second;
        }
    }
    // Unrecognised names keep the service at info
    return LogLevel::INFO;
}

const char* RingBufferLogger::logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

void RingBufferLogger::drainLoop() {
    while (running_) {
        flush();

        std::unique_lock<std::mutex> lock(wait_mutex_);
        wait_cv_.wait_for(lock, std::chrono::milliseconds(flush_interval_ms_.load()),
                          [this]() { return !running_; });
    }
}

uint64_t RingBufferLogger::wallClockNanos() {
    using std::chrono::nanoseconds;
    using std::chrono::system_clock;
    return static_cast<uint64_t>(
        std::chrono::duration_cast<nanoseconds>(system_clock::now().time_since_epoch()).count());
}

} // namespace common
} // namespace pricewatch
