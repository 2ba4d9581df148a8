/**
 * @file Logger.cpp
 * @brief Implementation of the leveled logger
 */

#include "Logger.hpp"
#include <filesystem>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <sstream>
#include <algorithm>
#include <cctype>

namespace planet {

std::unordered_map<std::string, LogLevel> Logger::facility_levels_;
LogLevel Logger::default_level_ = LogLevel::INFO;
std::shared_ptr<std::ofstream> Logger::shared_file_stream_;
std::mutex Logger::registry_mutex_;

namespace {

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\n\r");
    return text.substr(first, last - first + 1);
}

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR:    return "ERROR";
        case LogLevel::WARNING:  return "WARN ";
        case LogLevel::INFO:     return "INFO ";
        case LogLevel::DETAILED: return "DETL ";
        case LogLevel::DEBUG:    return "DEBUG";
        case LogLevel::TRACE:    return "TRACE";
    }
    return "?????";
}

} // namespace

std::optional<LogLevel> parse_log_level(const std::string& text) {
    std::string value = trim(text);
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (value == "error") return LogLevel::ERROR;
    if (value == "warning" || value == "warn") return LogLevel::WARNING;
    if (value == "info") return LogLevel::INFO;
    if (value == "detailed") return LogLevel::DETAILED;
    if (value == "debug") return LogLevel::DEBUG;
    if (value == "trace") return LogLevel::TRACE;

    try {
        size_t consumed = 0;
        int level_int = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            return std::nullopt;
        }
        return static_cast<LogLevel>(std::clamp(level_int, 1, 6));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

Logger::Logger()
    : current_level_(LogLevel::WARNING), explicit_level_(false),
      repeat_count_(0), has_last_message_(false) {
}

Logger::Logger(const std::string& component_name)
    : current_level_(LogLevel::WARNING), explicit_level_(false),
      component_name_(component_name), repeat_count_(0), has_last_message_(false) {
}

Logger::Logger(LogLevel level, const std::optional<std::string>& log_file)
    : current_level_(level), explicit_level_(true), log_file_path_(log_file),
      repeat_count_(0), has_last_message_(false) {
    if (log_file.has_value()) {
        initializeFileStream();
    }
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(output_mutex_);
    emitRepeatSummary();
    std::cout.flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::outputMessage(LogLevel level, const std::string& message) const {
    std::lock_guard<std::mutex> lock(output_mutex_);

    if (static_cast<int>(level) > static_cast<int>(getEffectiveLevel())) {
        return;
    }

    if (has_last_message_ && message == last_message_ && level == last_level_) {
        repeat_count_++;
        return;
    }

    emitRepeatSummary();
    doOutput(level, message);

    last_message_ = message;
    last_level_ = level;
    repeat_count_ = 0;
    has_last_message_ = true;
}

void Logger::emitRepeatSummary() const {
    if (has_last_message_ && repeat_count_ > 0) {
        doOutput(last_level_, "The previous message occurred " +
                 std::to_string(repeat_count_ + 1) + " times.");
        repeat_count_ = 0;
    }
}

void Logger::setLogFile(const std::optional<std::string>& log_file) {
    std::lock_guard<std::mutex> lock(output_mutex_);

    log_file_path_ = log_file;
    if (file_stream_) {
        file_stream_->close();
        file_stream_.reset();
    }
    if (log_file.has_value()) {
        initializeFileStream();
    }
}

void Logger::initializeFileStream() {
    if (!log_file_path_.has_value()) {
        return;
    }
    try {
        std::filesystem::path log_path(log_file_path_.value());
        if (log_path.has_parent_path()) {
            std::filesystem::create_directories(log_path.parent_path());
        }
        file_stream_ = std::make_shared<std::ofstream>(log_file_path_.value(), std::ios::app);
        if (!file_stream_->is_open()) {
            // outputMessage would recurse here
            std::cerr << "Warning: Failed to open log file: " << log_file_path_.value() << std::endl;
            file_stream_.reset();
        }
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "Warning: Cannot create log directory: " << e.what() << std::endl;
        file_stream_.reset();
    }
}

void Logger::doOutput(LogLevel level, const std::string& message) const {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&time_t, &tm_buf);
    char timestamp[32];
    std::snprintf(timestamp, sizeof(timestamp), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, static_cast<int>(ms.count()));

    std::ostringstream line;
    line << "[" << timestamp << "] " << level_tag(level) << " ";
    if (!component_name_.empty()) {
        line << component_name_ << ": ";
    }
    line << message;

    // Errors and warnings go to stderr so mesh data piped on stdout stays clean
    std::ostream& console = (level <= LogLevel::WARNING) ? std::cerr : std::cout;
    console << line.str() << std::endl;

    std::shared_ptr<std::ofstream> sink = file_stream_;
    if (!sink) {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        sink = shared_file_stream_;
    }
    if (sink && sink->is_open()) {
        *sink << line.str() << std::endl;
    }
}

void Logger::flush() const {
    std::lock_guard<std::mutex> lock(output_mutex_);
    emitRepeatSummary();
    std::cout.flush();
    std::cerr.flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

// ----------------------------------------------------------------------------
// Facility registry
// ----------------------------------------------------------------------------

void Logger::setFacilityLevel(const std::string& facility, LogLevel level) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    facility_levels_[facility] = level;
}

void Logger::setDefaultLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    default_level_ = level;
}

LogLevel Logger::getFacilityLevel(const std::string& facility) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = facility_levels_.find(facility);
    return it != facility_levels_.end() ? it->second : default_level_;
}

void Logger::parseLogConfig(const std::string& config) {
    if (config.empty()) return;

    std::stringstream ss(config);
    std::string token;

    while (std::getline(ss, token, ',')) {
        token = trim(token);
        if (token.empty()) continue;

        std::string facility = "default";
        std::string level_str = token;
        size_t equals_pos = token.find('=');
        if (equals_pos != std::string::npos) {
            facility = trim(token.substr(0, equals_pos));
            level_str = trim(token.substr(equals_pos + 1));
        }

        auto level = parse_log_level(level_str);
        if (!level) {
            std::cerr << "Warning: Invalid log level '" << level_str
                      << "' for facility '" << facility << "'" << std::endl;
            continue;
        }

        std::lock_guard<std::mutex> lock(registry_mutex_);
        if (facility == "default") {
            default_level_ = *level;
        } else {
            facility_levels_[facility] = *level;
        }
    }
}

void Logger::clearFacilityLevels() {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    facility_levels_.clear();
}

void Logger::setSharedLogFile(const std::optional<std::string>& log_file) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    shared_file_stream_.reset();
    if (!log_file.has_value()) {
        return;
    }
    auto stream = std::make_shared<std::ofstream>(log_file.value(), std::ios::app);
    if (!stream->is_open()) {
        std::cerr << "Warning: Failed to open log file: " << log_file.value() << std::endl;
        return;
    }
    shared_file_stream_ = stream;
}

LogLevel Logger::getEffectiveLevel() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    if (!component_name_.empty()) {
        auto it = facility_levels_.find(component_name_);
        if (it != facility_levels_.end()) {
            return it->second;
        }
    }
    return explicit_level_ ? current_level_ : default_level_;
}

} // namespace planet
