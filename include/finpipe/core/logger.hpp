// include/finpipe/core/logger.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <sstream>
#include <string>
#include "finpipe/core/config_base.hpp"

namespace finpipe {

/**
 * @brief Log levels for different types of messages
 */
enum class LogLevel {
    TRACE,    // Per-record detail (parsed rows, permit bookkeeping)
    DEBUG,    // Per-batch detail
    INFO,     // Ingestion summaries, ticks, migrations
    WARNING,  // Recoverable failures (quota, provider down)
    ERR,      // Failed operations
    FATAL     // Startup failures
};

/**
 * @brief Log destination type
 */
enum class LogDestination {
    CONSOLE,
    FILE,
    BOTH
};

inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE:
            return "TRACE";
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::WARNING:
            return "WARNING";
        case LogLevel::ERR:
            return "ERROR";
        case LogLevel::FATAL:
            return "FATAL";
        default:
            return "UNKNOWN";
    }
}

inline std::optional<LogLevel> level_from_string(const std::string& value) {
    if (value == "TRACE")
        return LogLevel::TRACE;
    if (value == "DEBUG")
        return LogLevel::DEBUG;
    if (value == "INFO")
        return LogLevel::INFO;
    if (value == "WARNING" || value == "WARN")
        return LogLevel::WARNING;
    if (value == "ERROR")
        return LogLevel::ERR;
    if (value == "FATAL")
        return LogLevel::FATAL;
    return std::nullopt;
}

inline std::string log_destination_to_string(LogDestination dest) {
    switch (dest) {
        case LogDestination::CONSOLE:
            return "CONSOLE";
        case LogDestination::FILE:
            return "FILE";
        case LogDestination::BOTH:
            return "BOTH";
        default:
            return "UNKNOWN";
    }
}

inline std::optional<LogDestination> log_destination_from_string(const std::string& value) {
    if (value == "CONSOLE")
        return LogDestination::CONSOLE;
    if (value == "FILE")
        return LogDestination::FILE;
    if (value == "BOTH")
        return LogDestination::BOTH;
    return std::nullopt;
}

/**
 * @brief Configuration for the logger
 */
struct LoggerConfig : public ConfigBase {
    LogLevel min_level{LogLevel::INFO};
    LogDestination destination{LogDestination::CONSOLE};
    std::string log_directory{"logs"};
    std::string filename_prefix{"finpipe"};
    bool include_timestamp{true};
    bool include_level{true};
    bool utc_timestamps{true};               // Stored dates are UTC, so are log lines
    size_t max_file_size{20 * 1024 * 1024};  // Rotate after 20MB
    size_t max_files{5};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["min_level"] = level_to_string(min_level);
        j["destination"] = log_destination_to_string(destination);
        j["log_directory"] = log_directory;
        j["filename_prefix"] = filename_prefix;
        j["include_timestamp"] = include_timestamp;
        j["include_level"] = include_level;
        j["utc_timestamps"] = utc_timestamps;
        j["max_file_size"] = max_file_size;
        j["max_files"] = max_files;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("min_level")) {
            if (auto level = level_from_string(j.at("min_level").get<std::string>()))
                min_level = *level;
        }
        if (j.contains("destination")) {
            if (auto dest = log_destination_from_string(j.at("destination").get<std::string>()))
                destination = *dest;
        }
        if (j.contains("log_directory"))
            log_directory = j.at("log_directory").get<std::string>();
        if (j.contains("filename_prefix"))
            filename_prefix = j.at("filename_prefix").get<std::string>();
        if (j.contains("include_timestamp"))
            include_timestamp = j.at("include_timestamp").get<bool>();
        if (j.contains("include_level"))
            include_level = j.at("include_level").get<bool>();
        if (j.contains("utc_timestamps"))
            utc_timestamps = j.at("utc_timestamps").get<bool>();
        if (j.contains("max_file_size"))
            max_file_size = j.at("max_file_size").get<size_t>();
        if (j.contains("max_files"))
            max_files = j.at("max_files").get<size_t>();
    }
};

/**
 * @brief Thread-safe process-wide logger
 */
class Logger {
public:
    static Logger& instance();

    /**
     * @brief Initialize the logger with configuration
     * @throws std::runtime_error if the log directory or file cannot be opened
     */
    void initialize(const LoggerConfig& config);

    /**
     * @brief Close any open file and forget the configuration (tests only)
     */
    static void reset_for_tests();

    void log(LogLevel level, const std::string& message);

    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        config_.min_level = level;
        min_level_.store(level, std::memory_order_relaxed);
    }

    LogLevel get_min_level() const {
        return min_level_.load(std::memory_order_relaxed);
    }

    bool is_initialized() const {
        return initialized_.load(std::memory_order_acquire);
    }

    /**
     * @brief Tag subsequent messages from the calling thread with a component name
     */
    static void register_component(const std::string& component) {
        current_component_ = component;
    }

    static const std::string& current_component() {
        return current_component_;
    }

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void open_log_file_unsafe();
    void prune_old_files_unsafe();
    void write_to_file_unsafe(const std::string& message);
    std::string format_message(LogLevel level, const std::string& message) const;

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::ofstream log_file_;
    std::atomic<bool> initialized_{false};
    std::atomic<LogLevel> min_level_{LogLevel::INFO};
    std::string session_timestamp_;
    int part_number_{1};
    static thread_local std::string current_component_;
};

/**
 * @brief Restores the previous thread component tag on scope exit
 */
class ScopedLogComponent {
public:
    explicit ScopedLogComponent(const std::string& component)
        : previous_(Logger::current_component()) {
        Logger::register_component(component);
    }
    ~ScopedLogComponent() {
        Logger::register_component(previous_);
    }

private:
    std::string previous_;
};

/**
 * @brief Convenience macro for logging
 * Usage: LOG(LogLevel::INFO, "Upserted " << count << " bars")
 */
#define LOG(level, message)                                \
    do {                                                   \
        if (level >= Logger::instance().get_min_level()) { \
            std::ostringstream os;                         \
            os << message;                                 \
            Logger::instance().log(level, os.str());       \
        }                                                  \
    } while (0)

#define TRACE(message) LOG(LogLevel::TRACE, message)
#define DEBUG(message) LOG(LogLevel::DEBUG, message)
#define INFO(message) LOG(LogLevel::INFO, message)
#define WARN(message) LOG(LogLevel::WARNING, message)
#define ERROR(message) LOG(LogLevel::ERR, message)
#define FATAL(message) LOG(LogLevel::FATAL, message)
}  // namespace finpipe
