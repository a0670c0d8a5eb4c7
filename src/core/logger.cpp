// src/core/logger.cpp

#include "finpipe/core/logger.hpp"
#include <algorithm>
#include <vector>
#include "finpipe/core/time_utils.hpp"

namespace finpipe {

thread_local std::string Logger::current_component_;

namespace {

std::string session_stamp() {
    auto now_c = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm time_info;
    core::safe_localtime(&now_c, &time_info);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y%m%d_%H%M%S", &time_info);
    return std::string(buffer);
}

}  // namespace

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

void Logger::reset_for_tests() {
    Logger& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);
    logger.initialized_.store(false, std::memory_order_release);
    if (logger.log_file_.is_open()) {
        logger.log_file_.close();
    }
    logger.config_ = LoggerConfig();
    logger.min_level_.store(LogLevel::INFO, std::memory_order_relaxed);
    logger.session_timestamp_.clear();
    logger.part_number_ = 1;
}

void Logger::initialize(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_.is_open()) {
        log_file_.close();
    }
    config_ = config;
    min_level_.store(config.min_level, std::memory_order_relaxed);

    if (config_.destination != LogDestination::CONSOLE) {
        std::filesystem::path log_dir = std::filesystem::absolute(config_.log_directory);
        std::error_code ec;
        std::filesystem::create_directories(log_dir, ec);
        if (ec) {
            throw std::runtime_error("Failed to create log directory: " + log_dir.string() +
                                     " - " + ec.message());
        }
        session_timestamp_ = session_stamp();
        part_number_ = 1;
        prune_old_files_unsafe();
        open_log_file_unsafe();
        if (!log_file_.is_open()) {
            throw std::runtime_error("Failed to open log file in " + log_dir.string());
        }
    }

    initialized_.store(true, std::memory_order_release);
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!initialized_.load(std::memory_order_acquire)) {
        std::cerr << "WARNING: Logger not initialized. Message: " << message << std::endl;
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (level < config_.min_level) {
        return;
    }

    std::string line = format_message(level, message);
    if (config_.destination != LogDestination::FILE) {
        // Warnings and worse go to stderr so a daemon's stdout stays clean
        std::ostream& out = level >= LogLevel::WARNING ? std::cerr : std::cout;
        out << line << std::endl;
    }
    if (config_.destination != LogDestination::CONSOLE) {
        write_to_file_unsafe(line);
    }
}

std::string Logger::format_message(LogLevel level, const std::string& message) const {
    std::ostringstream ss;
    if (config_.include_timestamp) {
        auto now_c = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm time_info;
        if (config_.utc_timestamps) {
            core::safe_gmtime(&now_c, &time_info);
        } else {
            core::safe_localtime(&now_c, &time_info);
        }
        char time_str[32];
        std::strftime(time_str, sizeof(time_str), "%Y-%m-%d %H:%M:%S", &time_info);
        ss << time_str << " ";
    }
    if (config_.include_level) {
        ss << "[" << level_to_string(level) << "] ";
    }
    if (!current_component_.empty()) {
        ss << "[" << current_component_ << "] ";
    }
    ss << message;
    return ss.str();
}

void Logger::open_log_file_unsafe() {
    std::filesystem::path log_dir = std::filesystem::absolute(config_.log_directory);
    std::filesystem::path log_path =
        log_dir / (config_.filename_prefix + "_" + session_timestamp_ + "_part" +
                   std::to_string(part_number_) + ".log");
    log_file_.open(log_path, std::ios::app);
}

void Logger::prune_old_files_unsafe() {
    std::filesystem::path log_dir = std::filesystem::absolute(config_.log_directory);
    std::vector<std::filesystem::path> log_files;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(log_dir, ec)) {
        const auto& path = entry.path();
        if (entry.is_regular_file() && path.extension() == ".log" &&
            path.filename().string().rfind(config_.filename_prefix, 0) == 0) {
            log_files.push_back(path);
        }
    }
    std::sort(log_files.begin(), log_files.end(), [](const auto& a, const auto& b) {
        return std::filesystem::last_write_time(a) < std::filesystem::last_write_time(b);
    });
    // Leave room for the file about to be opened
    while (!log_files.empty() && log_files.size() >= config_.max_files) {
        std::filesystem::remove(log_files.front(), ec);
        log_files.erase(log_files.begin());
    }
}

void Logger::write_to_file_unsafe(const std::string& message) {
    if (!log_file_.is_open()) {
        return;
    }
    log_file_ << message << '\n';
    log_file_.flush();

    if (log_file_.tellp() >= static_cast<std::streampos>(config_.max_file_size)) {
        log_file_.close();
        prune_old_files_unsafe();
        ++part_number_;
        open_log_file_unsafe();
    }
}

}  // namespace finpipe
