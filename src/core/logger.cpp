// src/core/logger.cpp

#include "paper_ngin/core/logger.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <vector>
#include "paper_ngin/core/time_utils.hpp"

namespace paper_ngin {

thread_local std::string Logger::current_component_;

std::string level_to_string(LogLevel level) {
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
    }
    return "UNKNOWN";
}

std::optional<LogLevel> level_from_string(const std::string& value) {
    if (value == "TRACE")
        return LogLevel::TRACE;
    if (value == "DEBUG")
        return LogLevel::DEBUG;
    if (value == "INFO")
        return LogLevel::INFO;
    if (value == "WARNING")
        return LogLevel::WARNING;
    if (value == "ERROR")
        return LogLevel::ERR;
    if (value == "FATAL")
        return LogLevel::FATAL;
    return std::nullopt;
}

std::string log_destination_to_string(LogDestination dest) {
    switch (dest) {
        case LogDestination::CONSOLE:
            return "CONSOLE";
        case LogDestination::FILE:
            return "FILE";
        case LogDestination::BOTH:
            return "BOTH";
    }
    return "UNKNOWN";
}

std::optional<LogDestination> log_destination_from_string(const std::string& value) {
    if (value == "CONSOLE")
        return LogDestination::CONSOLE;
    if (value == "FILE")
        return LogDestination::FILE;
    if (value == "BOTH")
        return LogDestination::BOTH;
    return std::nullopt;
}

nlohmann::json LoggerConfig::to_json() const {
    nlohmann::json j;
    j["min_level"] = level_to_string(min_level);
    j["destination"] = log_destination_to_string(destination);
    j["log_directory"] = log_directory;
    j["filename_prefix"] = filename_prefix;
    j["include_timestamp"] = include_timestamp;
    j["include_level"] = include_level;
    j["max_file_size"] = max_file_size;
    j["max_files"] = max_files;
    j["version"] = version;
    return j;
}

void LoggerConfig::from_json(const nlohmann::json& j) {
    if (j.contains("min_level")) {
        const auto name = j.at("min_level").get<std::string>();
        auto level = level_from_string(name);
        if (!level)
            throw TradeError(ErrorCode::INVALID_ARGUMENT, "Unknown log level: " + name, "Logger");
        min_level = *level;
    }
    if (j.contains("destination")) {
        const auto name = j.at("destination").get<std::string>();
        auto dest = log_destination_from_string(name);
        if (!dest)
            throw TradeError(ErrorCode::INVALID_ARGUMENT, "Unknown log destination: " + name,
                             "Logger");
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
    if (j.contains("max_file_size"))
        max_file_size = j.at("max_file_size").get<size_t>();
    if (j.contains("max_files"))
        max_files = j.at("max_files").get<size_t>();
    if (j.contains("version"))
        version = j.at("version").get<std::string>();
}

Result<void> LoggerConfig::validate() const {
    if (destination != LogDestination::CONSOLE && log_directory.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "log_directory is required for file logging", "LoggerConfig");
    }
    if (max_files == 0 || max_file_size == 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "max_files and max_file_size must be positive", "LoggerConfig");
    }
    return Result<void>();
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;

    if (log_file_.is_open()) {
        log_file_.close();
    }

    if (config_.destination == LogDestination::FILE ||
        config_.destination == LogDestination::BOTH) {
        std::filesystem::path log_dir = std::filesystem::absolute(config_.log_directory);

        std::error_code ec;
        std::filesystem::create_directories(log_dir, ec);
        if (ec) {
            throw std::runtime_error("Failed to create log directory: " + log_dir.string() +
                                     " - " + ec.message());
        }

        // Retention is enforced before opening so the directory never exceeds max_files
        enforce_retention();

        current_session_timestamp_ = core::get_formatted_time("%Y%m%d_%H%M%S");
        current_part_number_ = 1;
        open_log_file();

        if (!log_file_.is_open()) {
            throw std::runtime_error("Failed to open log file in " + log_dir.string());
        }
    }

    initialized_.store(true, std::memory_order_release);
}

Logger::~Logger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
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

    std::string formatted_message = format_message(level, message);

    if (config_.destination == LogDestination::CONSOLE ||
        config_.destination == LogDestination::BOTH) {
        write_to_console_unsafe(level, formatted_message);
    }

    if (config_.destination == LogDestination::FILE ||
        config_.destination == LogDestination::BOTH) {
        write_to_file_unsafe(formatted_message);
    }
}

std::string Logger::format_message(LogLevel level, const std::string& message) const {
    std::ostringstream ss;

    if (config_.include_timestamp) {
        ss << core::get_formatted_time("%Y-%m-%d %H:%M:%S") << " ";
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

void Logger::write_to_console_unsafe(LogLevel level, const std::string& message) {
    // Assumes mutex is already held
    if (level >= LogLevel::ERR) {
        std::cerr << message << std::endl;
    } else {
        std::cout << message << std::endl;
    }
}

void Logger::write_to_file_unsafe(const std::string& message) {
    // Assumes mutex is already held
    if (!log_file_.is_open()) {
        return;
    }

    log_file_ << message << std::endl;
    log_file_.flush();

    if (log_file_.tellp() >= static_cast<std::streampos>(config_.max_file_size)) {
        rotate_log_files();
    }
}

void Logger::open_log_file() {
    std::filesystem::path log_dir = std::filesystem::absolute(config_.log_directory);

    // prefix_YYYYMMDD_HHMMSS_partN.log
    std::filesystem::path log_path =
        log_dir / (config_.filename_prefix + "_" + current_session_timestamp_ + "_part" +
                   std::to_string(current_part_number_) + ".log");

    log_file_.open(log_path, std::ios::app);
}

void Logger::enforce_retention() {
    std::filesystem::path log_dir = std::filesystem::absolute(config_.log_directory);

    std::vector<std::filesystem::path> log_files;
    for (const auto& entry : std::filesystem::directory_iterator(log_dir)) {
        if (entry.is_regular_file() && entry.path().extension() == ".log") {
            log_files.push_back(entry.path());
        }
    }

    std::sort(log_files.begin(), log_files.end(), [](const auto& a, const auto& b) {
        return std::filesystem::last_write_time(a) < std::filesystem::last_write_time(b);
    });

    while (!log_files.empty() && log_files.size() >= config_.max_files) {
        std::error_code ec;
        std::filesystem::remove(log_files.front(), ec);
        log_files.erase(log_files.begin());
    }
}

void Logger::rotate_log_files() {
    log_file_.close();
    enforce_retention();
    current_part_number_++;
    open_log_file();
}

}  // namespace paper_ngin
