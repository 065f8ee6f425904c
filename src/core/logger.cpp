// src/core/logger.cpp

#include "tempo_ngin/core/logger.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <vector>
#include "tempo_ngin/core/time_utils.hpp"

namespace tempo_ngin {

thread_local std::string Logger::current_component_;
thread_local std::string Logger::current_step_date_;

namespace {

std::string local_time(const char* format) {
    auto now_c = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm time_info{};
    core::safe_localtime(&now_c, &time_info);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), format, &time_info);
    return std::string(buffer);
}

}  // namespace

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
        default:
            return "UNKNOWN";
    }
}

LogLevel level_from_string(const std::string& name) {
    static const std::pair<const char*, LogLevel> levels[] = {
        {"TRACE", LogLevel::TRACE}, {"DEBUG", LogLevel::DEBUG}, {"INFO", LogLevel::INFO},
        {"WARNING", LogLevel::WARNING}, {"ERROR", LogLevel::ERR}, {"FATAL", LogLevel::FATAL}};
    for (const auto& entry : levels) {
        if (name == entry.first) {
            return entry.second;
        }
    }
    throw std::invalid_argument("Unknown log level: " + name);
}

std::string log_destination_to_string(LogDestination destination) {
    switch (destination) {
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

LogDestination log_destination_from_string(const std::string& name) {
    if (name == "CONSOLE")
        return LogDestination::CONSOLE;
    if (name == "FILE")
        return LogDestination::FILE;
    if (name == "BOTH")
        return LogDestination::BOTH;
    throw std::invalid_argument("Unknown log destination: " + name);
}

Result<void> LoggerConfig::validate() const {
    if (destination != LogDestination::CONSOLE) {
        if (log_directory.empty() || filename_prefix.empty()) {
            return make_error<void>(ErrorCode::INVALID_CONFIG,
                                    "File logging needs a log_directory and filename_prefix",
                                    "LoggerConfig");
        }
        if (max_file_size == 0 || max_files == 0) {
            return make_error<void>(ErrorCode::INVALID_CONFIG,
                                    "max_file_size and max_files must be positive",
                                    "LoggerConfig");
        }
    }
    return Result<void>();
}

nlohmann::json LoggerConfig::to_json() const {
    nlohmann::json j;
    j["min_level"] = level_to_string(min_level);
    j["destination"] = log_destination_to_string(destination);
    j["log_directory"] = log_directory;
    j["filename_prefix"] = filename_prefix;
    j["include_timestamp"] = include_timestamp;
    j["include_level"] = include_level;
    j["include_step_date"] = include_step_date;
    j["max_file_size"] = max_file_size;
    j["max_files"] = max_files;
    j["version"] = version;
    return j;
}

void LoggerConfig::from_json(const nlohmann::json& j) {
    if (j.contains("min_level"))
        min_level = level_from_string(j.at("min_level").get<std::string>());
    if (j.contains("destination"))
        destination = log_destination_from_string(j.at("destination").get<std::string>());
    if (j.contains("log_directory"))
        log_directory = j.at("log_directory").get<std::string>();
    if (j.contains("filename_prefix"))
        filename_prefix = j.at("filename_prefix").get<std::string>();
    if (j.contains("include_timestamp"))
        include_timestamp = j.at("include_timestamp").get<bool>();
    if (j.contains("include_level"))
        include_level = j.at("include_level").get<bool>();
    if (j.contains("include_step_date"))
        include_step_date = j.at("include_step_date").get<bool>();
    if (j.contains("max_file_size"))
        max_file_size = j.at("max_file_size").get<size_t>();
    if (j.contains("max_files"))
        max_files = j.at("max_files").get<size_t>();
    if (j.contains("version"))
        version = j.at("version").get<std::string>();
}

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
    logger.min_level_.store(LogLevel::WARNING, std::memory_order_release);
    if (logger.log_file_.is_open()) {
        logger.log_file_.close();
    }
    logger.config_ = LoggerConfig();
    logger.session_timestamp_.clear();
    logger.part_number_ = 1;
}

void Logger::initialize(const LoggerConfig& config) {
    auto valid = config.validate();
    if (valid.is_error()) {
        throw std::runtime_error(valid.error()->to_string());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    if (log_file_.is_open()) {
        log_file_.close();
    }

    if (config_.destination != LogDestination::CONSOLE) {
        std::filesystem::path log_dir = std::filesystem::absolute(config_.log_directory);
        std::error_code ec;
        std::filesystem::create_directories(log_dir, ec);
        if (ec) {
            throw std::runtime_error("Failed to create log directory: " + log_dir.string() +
                                     " - " + ec.message());
        }
        enforce_retention_unsafe(log_dir);
        session_timestamp_ = local_time("%Y%m%d_%H%M%S");
        part_number_ = 1;
        open_part_file_unsafe();
        if (!log_file_.is_open()) {
            throw std::runtime_error("Failed to open log file in " + log_dir.string());
        }
    }

    min_level_.store(config_.min_level, std::memory_order_release);
    initialized_.store(true, std::memory_order_release);
}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_.load(std::memory_order_acquire)) {
        if (level >= LogLevel::WARNING) {
            std::cerr << format_message(level, message) << std::endl;
        }
        return;
    }
    if (level < config_.min_level) {
        return;
    }

    std::string formatted = format_message(level, message);
    if (config_.destination != LogDestination::FILE) {
        std::cerr << formatted << std::endl;
    }
    if (config_.destination != LogDestination::CONSOLE && log_file_.is_open()) {
        log_file_ << formatted << std::endl;
        if (log_file_.tellp() >= static_cast<std::streampos>(config_.max_file_size)) {
            rotate_log_files_unsafe();
        }
    }
}

std::string Logger::format_message(LogLevel level, const std::string& message) const {
    std::ostringstream ss;
    if (config_.include_timestamp) {
        ss << local_time("%Y-%m-%d %H:%M:%S") << " ";
    }
    if (config_.include_level) {
        ss << "[" << level_to_string(level) << "] ";
    }
    if (!current_component_.empty()) {
        ss << "[" << current_component_ << "] ";
    }
    if (config_.include_step_date && !current_step_date_.empty()) {
        ss << "<" << current_step_date_ << "> ";
    }
    ss << message;
    return ss.str();
}

void Logger::open_part_file_unsafe() {
    // prefix_YYYYMMDD_HHMMSS_partN.log
    std::filesystem::path log_path =
        std::filesystem::absolute(config_.log_directory) /
        (config_.filename_prefix + "_" + session_timestamp_ + "_part" +
         std::to_string(part_number_) + ".log");
    log_file_.open(log_path, std::ios::app);
}

void Logger::enforce_retention_unsafe(const std::filesystem::path& log_dir) {
    std::vector<std::filesystem::path> log_files;
    for (const auto& entry : std::filesystem::directory_iterator(log_dir)) {
        if (entry.is_regular_file() && entry.path().extension() == ".log" &&
            entry.path().filename().string().rfind(config_.filename_prefix, 0) == 0) {
            log_files.push_back(entry.path());
        }
    }
    std::sort(log_files.begin(), log_files.end(), [](const auto& a, const auto& b) {
        return std::filesystem::last_write_time(a) < std::filesystem::last_write_time(b);
    });

    // Leave room for the file about to be opened
    while (!log_files.empty() && log_files.size() >= config_.max_files) {
        std::error_code ec;
        std::filesystem::remove(log_files.front(), ec);
        log_files.erase(log_files.begin());
    }
}

void Logger::rotate_log_files_unsafe() {
    log_file_.close();
    enforce_retention_unsafe(std::filesystem::absolute(config_.log_directory));
    ++part_number_;
    open_part_file_unsafe();
}

}  // namespace tempo_ngin
