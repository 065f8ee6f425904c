// include/tempo_ngin/core/logger.hpp
#pragma once

#include <atomic>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include "tempo_ngin/core/config_base.hpp"

namespace tempo_ngin {

/**
 * @brief Log levels for different types of messages
 */
enum class LogLevel {
    TRACE,    // Per-step detail
    DEBUG,    // Layer decisions
    INFO,     // Run lifecycle
    WARNING,  // Fallbacks and degraded steps
    ERR,      // Errors that fail the run
    FATAL     // Programming defects
};

enum class LogDestination {
    CONSOLE,  // Standard error; standard output is left to result exports
    FILE,
    BOTH
};

std::string level_to_string(LogLevel level);

/**
 * @throws std::invalid_argument for an unknown level name
 */
LogLevel level_from_string(const std::string& name);

std::string log_destination_to_string(LogDestination destination);

/**
 * @throws std::invalid_argument for an unknown destination name
 */
LogDestination log_destination_from_string(const std::string& name);

/**
 * @brief Configuration for the logger
 */
struct LoggerConfig : public ConfigBase {
    LogLevel min_level{LogLevel::INFO};
    LogDestination destination{LogDestination::CONSOLE};
    std::string log_directory{"logs"};
    std::string filename_prefix{"tempo_ngin"};
    bool include_timestamp{true};
    bool include_level{true};
    bool include_step_date{true};            // Prefix messages with the simulated decision date
    size_t max_file_size{50 * 1024 * 1024};  // Bytes before a new part file is started
    size_t max_files{10};                    // Part files kept in log_directory

    std::string version{"1.0.0"};

    Result<void> validate() const override;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Thread-safe process-wide logger
 *
 * Component and step date are thread-local, so strategy workers tag their
 * own messages. Before initialize() only warnings and errors are written,
 * to standard error.
 */
class Logger {
public:
    static Logger& instance();

    /**
     * @throws std::runtime_error when the log directory or file cannot be opened
     */
    void initialize(const LoggerConfig& config);

    static void reset_for_tests();

    void log(LogLevel level, const std::string& message);

    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        config_.min_level = level;
        min_level_.store(level, std::memory_order_release);
    }

    LogLevel get_min_level() const {
        return min_level_.load(std::memory_order_acquire);
    }

    bool is_initialized() const {
        return initialized_.load(std::memory_order_acquire);
    }

    static void register_component(const std::string& component) {
        current_component_ = component;
    }

    static void set_step_date(const std::string& date) {
        current_step_date_ = date;
    }

    static const std::string& step_date() {
        return current_step_date_;
    }

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void open_part_file_unsafe();
    void rotate_log_files_unsafe();
    void enforce_retention_unsafe(const std::filesystem::path& log_dir);
    std::string format_message(LogLevel level, const std::string& message) const;

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::ofstream log_file_;
    std::atomic<bool> initialized_{false};
    std::atomic<LogLevel> min_level_{LogLevel::WARNING};
    std::string session_timestamp_;  // YYYYMMDD_HHMMSS
    int part_number_{1};

    static thread_local std::string current_component_;
    static thread_local std::string current_step_date_;
};

/**
 * @brief Tags this thread's messages with a decision date for one scope
 */
class StepLogContext {
public:
    explicit StepLogContext(const std::string& date) : previous_(Logger::step_date()) {
        Logger::set_step_date(date);
    }

    ~StepLogContext() {
        Logger::set_step_date(previous_);
    }

    StepLogContext(const StepLogContext&) = delete;
    StepLogContext& operator=(const StepLogContext&) = delete;

private:
    std::string previous_;
};

/**
 * Usage: LOG(LogLevel::INFO, "Rebalanced " << n << " assets")
 */
#define LOG(level, message)                                                  \
    do {                                                                     \
        if (level >= ::tempo_ngin::Logger::instance().get_min_level()) {     \
            std::ostringstream tempo_ngin_log_stream_;                       \
            tempo_ngin_log_stream_ << message;                               \
            ::tempo_ngin::Logger::instance().log(level,                      \
                                                 tempo_ngin_log_stream_.str()); \
        }                                                                    \
    } while (0)

#define TRACE(message) LOG(::tempo_ngin::LogLevel::TRACE, message)
#define DEBUG(message) LOG(::tempo_ngin::LogLevel::DEBUG, message)
#define INFO(message) LOG(::tempo_ngin::LogLevel::INFO, message)
#define WARN(message) LOG(::tempo_ngin::LogLevel::WARNING, message)
#define ERROR(message) LOG(::tempo_ngin::LogLevel::ERR, message)
#define FATAL(message) LOG(::tempo_ngin::LogLevel::FATAL, message)

}  // namespace tempo_ngin
