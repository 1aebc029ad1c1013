// include/paper_ngin/core/logger.hpp
#pragma once

#include <atomic>
#include <fstream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <sstream>
#include <string>
#include "paper_ngin/core/config_base.hpp"

namespace paper_ngin {

/**
 * @brief Log levels for different types of messages
 */
enum class LogLevel {
    TRACE,    // Detailed debug information
    DEBUG,    // General debug information
    INFO,     // Entries, exits, rejections
    WARNING,  // Degraded but recoverable conditions
    ERR,      // Operation failed, portfolio still usable
    FATAL     // Bookkeeping invariant breached, portfolio halted
};

/**
 * @brief Log destination type
 */
enum class LogDestination {
    CONSOLE,  // Standard output
    FILE,     // File output
    BOTH      // Both console and file
};

std::string level_to_string(LogLevel level);
std::optional<LogLevel> level_from_string(const std::string& value);
std::string log_destination_to_string(LogDestination dest);
std::optional<LogDestination> log_destination_from_string(const std::string& value);

/**
 * @brief Configuration for the logger
 */
struct LoggerConfig : public ConfigBase {
    LogLevel min_level{LogLevel::INFO};
    LogDestination destination{LogDestination::CONSOLE};
    std::string log_directory{"logs"};
    std::string filename_prefix{"paper_ngin"};
    bool include_timestamp{true};
    bool include_level{true};
    size_t max_file_size{20 * 1024 * 1024};  // Rotate after 20MB
    size_t max_files{10};                    // Files kept in log_directory

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
    Result<void> validate() const override;
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
     * @brief Close files and mark uninitialized; used by tests
     */
    static void reset_for_tests() {
        std::lock_guard<std::mutex> lock(instance().mutex_);
        instance().initialized_ = false;
        if (instance().log_file_.is_open()) {
            instance().log_file_.close();
        }
        instance().current_session_timestamp_.clear();
        instance().current_part_number_ = 1;
    }

    void log(LogLevel level, const std::string& message);

    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        config_.min_level = level;
    }

    LogLevel get_min_level() const {
        return config_.min_level;
    }

    bool is_initialized() const {
        return initialized_.load(std::memory_order_acquire);
    }

    /**
     * @brief Tag subsequent messages from this thread with a component name
     */
    static void register_component(const std::string& component) {
        current_component_ = component;
    }

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    void open_log_file();
    void enforce_retention();
    void rotate_log_files();
    void write_to_file_unsafe(const std::string& message);
    void write_to_console_unsafe(LogLevel level, const std::string& message);
    std::string format_message(LogLevel level, const std::string& message) const;

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::ofstream log_file_;
    std::atomic<bool> initialized_{false};
    static thread_local std::string current_component_;

    std::string current_session_timestamp_;  // YYYYMMDD_HHMMSS
    int current_part_number_{1};
};

/**
 * @brief Convenience macro for logging
 * Usage: LOG(LogLevel::INFO, "Entered " << symbol << " x" << shares)
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
}  // namespace paper_ngin
