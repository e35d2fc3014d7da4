// include/order_ngin/core/logger.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include "order_ngin/core/config_base.hpp"

namespace order_ngin {

/**
 * @brief Log levels for different types of messages
 */
enum class LogLevel {
    TRACE,    // Detailed debug information
    DEBUG,    // General debug information
    INFO,     // Trade actions and plan lifecycle
    WARNING,  // Retries, double fills, unconfirmed cancels
    ERR,      // Plan failures
    FATAL     // Critical errors that require shutdown
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
LogLevel level_from_string(const std::string& str, LogLevel fallback = LogLevel::INFO);
std::string log_destination_to_string(LogDestination dest);
LogDestination log_destination_from_string(const std::string& str,
                                           LogDestination fallback = LogDestination::CONSOLE);

/**
 * @brief Configuration for the logger
 */
struct LoggerConfig : public ConfigBase {
    LogLevel min_level{LogLevel::INFO};
    LogDestination destination{LogDestination::CONSOLE};
    std::string log_directory{"logs"};
    std::string filename_prefix{"order_ngin"};
    bool include_timestamp{true};
    bool include_level{true};
    size_t max_file_size{10 * 1024 * 1024};  // Rotate after 10MB
    size_t max_files{10};                    // Files kept in log_directory

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Thread-safe logging class
 *
 * Worker threads tag their lines with a thread-local component name set
 * through register_component().
 */
class Logger {
public:
    static Logger& instance();

    /**
     * @brief Initialize the logger with configuration
     * @param config Logger configuration
     * @throws std::runtime_error if the log directory or file cannot be opened
     */
    void initialize(const LoggerConfig& config);

    /**
     * @brief Close sinks and forget configuration, for tests
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

    std::string current_log_file() const;

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

    void open_log_file_unsafe();
    void enforce_retention_unsafe(const std::filesystem::path& log_dir);
    void rotate_log_files_unsafe();
    void write_to_file_unsafe(const std::string& message);
    void write_to_console_unsafe(LogLevel level, const std::string& message);
    std::string format_message(LogLevel level, const std::string& message) const;

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::ofstream log_file_;
    std::filesystem::path log_path_;
    std::atomic<bool> initialized_{false};
    std::atomic<LogLevel> min_level_{LogLevel::INFO};
    static thread_local std::string current_component_;

    std::string session_timestamp_;  // YYYYMMDD_HHMMSS
    int part_number_{1};
};

/**
 * @brief Convenience macro for logging
 * Usage: LOG(LogLevel::INFO, "Message: " << variable)
 */
#define LOG(level, message)                                              \
    do {                                                                 \
        if (level >= ::order_ngin::Logger::instance().get_min_level()) { \
            std::ostringstream os;                                       \
            os << message;                                               \
            ::order_ngin::Logger::instance().log(level, os.str());       \
        }                                                                \
    } while (0)

#define TRACE(message) LOG(::order_ngin::LogLevel::TRACE, message)
#define DEBUG(message) LOG(::order_ngin::LogLevel::DEBUG, message)
#define INFO(message) LOG(::order_ngin::LogLevel::INFO, message)
#define WARN(message) LOG(::order_ngin::LogLevel::WARNING, message)
#define ERROR(message) LOG(::order_ngin::LogLevel::ERR, message)
#define FATAL(message) LOG(::order_ngin::LogLevel::FATAL, message)
}  // namespace order_ngin
