/**
 * @file Logger.cpp
 * @brief Implementation of centralized logging
 */

#include "Logger.hpp"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <sstream>

namespace wayslope {

std::unordered_map<std::string, LogLevel> Logger::facility_levels_;
LogLevel Logger::default_level_ = LogLevel::INFO;
std::mutex Logger::registry_mutex_;
std::shared_ptr<std::ofstream> Logger::file_stream_;

namespace {

std::string trim(const std::string& text) {
    const char* whitespace = " \t\n\r";
    size_t first = text.find_first_not_of(whitespace);
    if (first == std::string::npos) return "";
    size_t last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

std::optional<LogLevel> parse_level(const std::string& text) {
    try {
        size_t consumed = 0;
        int level_int = std::stoi(text, &consumed);
        if (consumed != text.size()) return std::nullopt;
        return static_cast<LogLevel>(std::clamp(level_int, 1, 6));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace

const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::INFO: return "INFO";
        case LogLevel::DETAILED: return "DETAILED";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
    }
    return "UNKNOWN";
}

Logger::Logger(const std::string& component_name)
    : component_name_(component_name), last_level_(LogLevel::INFO),
      repeat_count_(0), has_last_message_(false) {
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(output_mutex_);
    flushRepeatSummary();
}

void Logger::outputMessage(LogLevel level, const std::string& message) const {
    std::lock_guard<std::mutex> lock(output_mutex_);

    // Single verbosity check
    if (static_cast<int>(level) > static_cast<int>(getEffectiveLevel())) {
        return;
    }

    if (has_last_message_ && message == last_message_ && level == last_level_) {
        repeat_count_++;
        return;
    }

    flushRepeatSummary();
    doOutput(level, message);

    last_message_ = message;
    last_level_ = level;
    repeat_count_ = 0;
    has_last_message_ = true;
}

void Logger::flushRepeatSummary() const {
    if (has_last_message_ && repeat_count_ > 0) {
        doOutput(last_level_, "The previous message occurred " +
                 std::to_string(repeat_count_ + 1) + " times.");
        repeat_count_ = 0;
    }
}

void Logger::doOutput(LogLevel level, const std::string& message) const {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm{};
    localtime_r(&time_t, &tm);
    char timestamp[32];
    std::snprintf(timestamp, sizeof(timestamp), "%02d:%02d:%02d.%03d",
                  tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms.count()));

    std::ostringstream line;
    line << "[" << timestamp << "] ";
    if (level == LogLevel::ERROR || level == LogLevel::WARNING) {
        line << to_string(level) << ": ";
    }
    if (!component_name_.empty() && static_cast<int>(level) >= static_cast<int>(LogLevel::DEBUG)) {
        line << component_name_ << ": ";
    }
    line << message;

    // Errors and warnings go to stderr so stdout stays clean for piping
    std::ostream& console = (level == LogLevel::ERROR || level == LogLevel::WARNING)
        ? std::cerr : std::cout;
    console << line.str() << std::endl;

    std::lock_guard<std::mutex> lock(registry_mutex_);
    if (file_stream_ && file_stream_->is_open()) {
        *file_stream_ << line.str() << std::endl;
    }
}

void Logger::flush() const {
    {
        std::lock_guard<std::mutex> lock(output_mutex_);
        flushRepeatSummary();
    }

    std::cout.flush();
    std::cerr.flush();

    std::lock_guard<std::mutex> lock(registry_mutex_);
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

LogLevel Logger::getEffectiveLevel() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = facility_levels_.find(component_name_);
    if (it != facility_levels_.end()) {
        return it->second;
    }
    return default_level_;
}

// ============================================================================
// Shared configuration
// ============================================================================

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
    if (it != facility_levels_.end()) {
        return it->second;
    }
    return default_level_;
}

void Logger::clearFacilityLevels() {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    facility_levels_.clear();
}

bool Logger::parseLogConfig(const std::string& config) {
    bool all_valid = true;

    std::stringstream ss(config);
    std::string token;
    while (std::getline(ss, token, ',')) {
        token = trim(token);
        if (token.empty()) continue;

        size_t equals_pos = token.find('=');
        if (equals_pos == std::string::npos) {
            auto level = parse_level(token);
            if (!level) {
                all_valid = false;
                continue;
            }
            setDefaultLevel(*level);
            continue;
        }

        std::string facility = trim(token.substr(0, equals_pos));
        auto level = parse_level(trim(token.substr(equals_pos + 1)));
        if (facility.empty() || !level) {
            all_valid = false;
            continue;
        }

        if (facility == "default") {
            setDefaultLevel(*level);
        } else {
            setFacilityLevel(facility, *level);
        }
    }

    return all_valid;
}

bool Logger::setLogFile(const std::optional<std::string>& log_file) {
    std::lock_guard<std::mutex> lock(registry_mutex_);

    if (file_stream_) {
        file_stream_->close();
        file_stream_.reset();
    }

    if (!log_file.has_value()) {
        return true;
    }

    std::error_code ec;
    std::filesystem::path log_path(log_file.value());
    if (log_path.has_parent_path()) {
        std::filesystem::create_directories(log_path.parent_path(), ec);
    }

    file_stream_ = std::make_shared<std::ofstream>(log_file.value(), std::ios::app);
    if (!file_stream_->is_open()) {
        file_stream_.reset();
        return false;
    }
    return true;
}

} // namespace wayslope
