/**
 * @file Logger.hpp
 * @brief Leveled, facility-aware logging for the mesh pipeline
 *
 * Every component owns a Logger named after itself. Output goes through a
 * single outputMessage() path so verbosity filtering and repeat folding
 * happen in one place.
 */

#pragma once

#include <iostream>
#include <fstream>
#include <memory>
#include <string>
#include <optional>
#include <mutex>
#include <cstdlib>
#include <unordered_map>

namespace planet {

/**
 * @brief Verbosity levels
 *
 * Level 1: Errors (the run cannot continue)
 * Level 2: Warnings (output may be degraded, e.g. a visible polar gap)
 * Level 3: Information (pipeline stages)
 * Level 4: Detailed information (per-patch counts)
 * Level 5: Basic debugging (per-row decisions)
 * Level 6: Detailed debugging (variable values)
 */
enum class LogLevel {
    ERROR = 1,
    WARNING = 2,
    INFO = 3,
    DETAILED = 4,
    DEBUG = 5,
    TRACE = 6
};

/**
 * @brief Parse a level given as a number ("4") or a name ("debug")
 * @return Parsed level, or nullopt when the text is neither
 */
std::optional<LogLevel> parse_log_level(const std::string& text);

class Logger {
public:
    Logger();

    /**
     * @brief Constructor with facility name
     * @param component_name Facility used for per-component level lookup and message prefix
     */
    explicit Logger(const std::string& component_name);

    /**
     * @brief Constructor with explicit level and optional file output
     * @param level Initial threshold
     * @param log_file Optional path to log file (appends if exists)
     */
    Logger(LogLevel level, const std::optional<std::string>& log_file = std::nullopt);

    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Emit a message if it passes the effective threshold
     *
     * Consecutive identical messages are folded into a single
     * "occurred N times" line.
     */
    void outputMessage(LogLevel level, const std::string& message) const;

    void setLogLevel(LogLevel level) { current_level_ = level; explicit_level_ = true; }
    LogLevel getLogLevel() const { return current_level_; }

    /**
     * @brief Set or change the log file
     * @param log_file Path to log file, or nullopt to disable file logging
     */
    void setLogFile(const std::optional<std::string>& log_file);

    bool shouldOutput(LogLevel level) const {
        return static_cast<int>(level) <= static_cast<int>(getEffectiveLevel());
    }

    void error(const std::string& message) const {
        outputMessage(LogLevel::ERROR, message);
    }

    /**
     * @brief Report an unrecoverable error and terminate the process
     * @param exit_code Process exit status
     */
    [[noreturn]] void fatal(const std::string& message, int exit_code = 1) const {
        outputMessage(LogLevel::ERROR, "FATAL: " + message);
        flush();
        std::exit(exit_code);
    }

    void warning(const std::string& message) const {
        outputMessage(LogLevel::WARNING, message);
    }

    void warn(const std::string& message) const { warning(message); }

    void info(const std::string& message) const {
        outputMessage(LogLevel::INFO, message);
    }

    void detailed(const std::string& message) const {
        outputMessage(LogLevel::DETAILED, message);
    }

    void debug(const std::string& message) const {
        outputMessage(LogLevel::DEBUG, message);
    }

    void trace(const std::string& message) const {
        outputMessage(LogLevel::TRACE, message);
        flush();
    }

    /**
     * @brief Flush console and file output, emitting any pending repeat summary
     */
    void flush() const;

    // ------------------------------------------------------------------
    // Facility registry shared by all Logger instances
    // ------------------------------------------------------------------

    /**
     * @brief Override the threshold for one facility
     *
     * @example
     * Logger::setFacilityLevel("Triangulator", LogLevel::TRACE);
     */
    static void setFacilityLevel(const std::string& facility, LogLevel level);

    static void setDefaultLevel(LogLevel level);

    static LogLevel getFacilityLevel(const std::string& facility);

    /**
     * @brief Apply a configuration string
     *
     * Accepts "5", "PointSampler=6,default=3" or a mix such as
     * "4,HemisphereSplitter=6". Unparseable entries are reported on
     * stderr and skipped.
     */
    static void parseLogConfig(const std::string& config);

    static void clearFacilityLevels();

    /**
     * @brief Route every Logger's file output to one path
     *
     * Instances created afterwards, and instances without their own file,
     * append to this file. Pass nullopt to disable.
     */
    static void setSharedLogFile(const std::optional<std::string>& log_file);

    /**
     * @brief Threshold for this instance
     *
     * Facility override first, then the instance level when it was set
     * explicitly, then the global default.
     */
    LogLevel getEffectiveLevel() const;

private:
    LogLevel current_level_;
    bool explicit_level_;
    std::string component_name_;
    std::optional<std::string> log_file_path_;
    std::shared_ptr<std::ofstream> file_stream_;
    mutable std::mutex output_mutex_;

    mutable std::string last_message_;
    mutable LogLevel last_level_;
    mutable int repeat_count_;
    mutable bool has_last_message_;

    static std::unordered_map<std::string, LogLevel> facility_levels_;
    static LogLevel default_level_;
    static std::shared_ptr<std::ofstream> shared_file_stream_;
    static std::mutex registry_mutex_;

    void initializeFileStream();
    void emitRepeatSummary() const;
    void doOutput(LogLevel level, const std::string& message) const;
};

} // namespace planet
