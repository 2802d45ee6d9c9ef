/**
 * @file Logger.hpp
 * @brief Centralized logging with per-facility verbosity control
 *
 * Every component owns a Logger named after itself (its facility). All
 * loggers share one verbosity registry and one optional log file, so a
 * single "--log-level 3,ElevationSampler=6" setting controls the whole run.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace wayslope {

/**
 * @brief Log levels
 *
 * Level 1: Errors (run aborts)
 * Level 2: Warnings
 * Level 3: Information (high-level, default)
 * Level 4: Detailed information (codepath execution)
 * Level 5: Basic debugging (objects, methods)
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
 * @brief Facility logger with a single point of output control
 */
class Logger {
public:
    /**
     * @brief Logger for a named facility (component)
     * @param component_name Facility name used for per-facility levels
     */
    explicit Logger(const std::string& component_name);

    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Output a message if it meets the facility's verbosity level
     *
     * Consecutive identical messages are collapsed into one line plus a
     * repeat count.
     */
    void outputMessage(LogLevel level, const std::string& message) const;

    bool shouldOutput(LogLevel level) const {
        return static_cast<int>(level) <= static_cast<int>(getEffectiveLevel());
    }

    void error(const std::string& message) const { outputMessage(LogLevel::ERROR, message); }
    void warning(const std::string& message) const { outputMessage(LogLevel::WARNING, message); }
    void info(const std::string& message) const { outputMessage(LogLevel::INFO, message); }
    void detailed(const std::string& message) const { outputMessage(LogLevel::DETAILED, message); }
    void debug(const std::string& message) const { outputMessage(LogLevel::DEBUG, message); }

    void trace(const std::string& message) const {
        outputMessage(LogLevel::TRACE, message);
        flush();
    }

    /**
     * @brief Flush pending repeat summary and all output streams
     */
    void flush() const;

    /**
     * @brief Effective level: facility-specific if set, otherwise the default
     */
    LogLevel getEffectiveLevel() const;

    const std::string& getComponentName() const { return component_name_; }

    // ========================================================================
    // Shared configuration
    // ========================================================================

    static void setFacilityLevel(const std::string& facility, LogLevel level);
    static void setDefaultLevel(LogLevel level);
    static LogLevel getFacilityLevel(const std::string& facility);
    static void clearFacilityLevels();

    /**
     * @brief Parse and apply a log configuration string
     *
     * Supported forms:
     * - "5"                               default level DEBUG
     * - "OsmPbfReader=6,SlopePipeline=3"  facility-specific levels
     * - "4,ElevationSampler=6"            mixed; "default=N" is also accepted
     *
     * @return false if any token could not be parsed (valid tokens still apply)
     */
    static bool parseLogConfig(const std::string& config);

    /**
     * @brief Set or clear the shared log file (opened in append mode)
     * @return false if the file could not be opened
     */
    static bool setLogFile(const std::optional<std::string>& log_file);

private:
    std::string component_name_;

    // Message deduplication state
    mutable std::mutex output_mutex_;
    mutable std::string last_message_;
    mutable LogLevel last_level_;
    mutable int repeat_count_;
    mutable bool has_last_message_;

    // Shared registry
    static std::unordered_map<std::string, LogLevel> facility_levels_;
    static LogLevel default_level_;
    static std::mutex registry_mutex_;
    static std::shared_ptr<std::ofstream> file_stream_;

    void flushRepeatSummary() const;
    void doOutput(LogLevel level, const std::string& message) const;
};

const char* to_string(LogLevel level);

} // namespace wayslope
