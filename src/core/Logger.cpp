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

namespace prefmap {

std::unordered_map<std::string, LogLevel> Logger::facility_levels_;
LogLevel Logger::default_level_ = LogLevel::INFO;
std::mutex Logger::registry_mutex_;
std::shared_ptr<std::ofstream> Logger::file_stream_;
std::mutex Logger::output_mutex_;

namespace {

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return "";
    const auto last = value.find_last_not_of(" \t\n\r");
    return value.substr(first, last - first + 1);
}

std::optional<LogLevel> parse_level(const std::string& text) {
    try {
        size_t consumed = 0;
        int level = std::stoi(text, &consumed);
        if (consumed != text.size()) return std::nullopt;
        return static_cast<LogLevel>(std::clamp(level, 1, 6));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace

const char* log_level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR:    return "ERROR";
        case LogLevel::WARNING:  return "WARN";
        case LogLevel::INFO:     return "INFO";
        case LogLevel::DETAILED: return "DETAIL";
        case LogLevel::DEBUG:    return "DEBUG";
        case LogLevel::TRACE:    return "TRACE";
    }
    return "?";
}

Logger::Logger() = default;

Logger::Logger(const std::string& component_name)
    : component_name_(component_name) {
}

void Logger::outputMessage(LogLevel level, const std::string& message) const {
    if (static_cast<int>(level) <= static_cast<int>(getEffectiveLevel())) {
        doOutput(level, message);
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
    line << "[" << timestamp << "] " << log_level_tag(level);
    if (!component_name_.empty()) {
        line << " " << component_name_ << ":";
    }
    line << " " << message;

    std::lock_guard<std::mutex> lock(output_mutex_);
    std::cerr << line.str() << std::endl;
    if (file_stream_ && file_stream_->is_open()) {
        *file_stream_ << line.str() << std::endl;
    }
}

void Logger::flush() const {
    std::lock_guard<std::mutex> lock(output_mutex_);
    std::cerr.flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

bool Logger::setLogFile(const std::optional<std::string>& path) {
    std::lock_guard<std::mutex> lock(output_mutex_);

    if (file_stream_) {
        file_stream_->close();
        file_stream_.reset();
    }
    if (!path.has_value() || path->empty()) {
        return true;
    }

    try {
        std::filesystem::path log_path(*path);
        if (log_path.has_parent_path()) {
            std::filesystem::create_directories(log_path.parent_path());
        }
        file_stream_ = std::make_shared<std::ofstream>(*path, std::ios::app);
        if (!file_stream_->is_open()) {
            // Don't log through outputMessage here, we hold output_mutex_
            std::cerr << "Warning: Failed to open log file: " << *path << std::endl;
            file_stream_.reset();
            return false;
        }
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "Warning: Cannot create log directory for " << *path << ": " << e.what() << std::endl;
        file_stream_.reset();
        return false;
    }
    return true;
}

// ============================================================================
// Facility registry
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
    return it != facility_levels_.end() ? it->second : default_level_;
}

bool Logger::parseLogConfig(const std::string& config) {
    if (config.empty()) return true;

    bool all_valid = true;
    std::lock_guard<std::mutex> lock(registry_mutex_);

    std::stringstream ss(config);
    std::string token;
    while (std::getline(ss, token, ',')) {
        token = trim(token);
        if (token.empty()) continue;

        size_t equals_pos = token.find('=');
        if (equals_pos == std::string::npos) {
            auto level = parse_level(token);
            if (level) {
                default_level_ = *level;
            } else {
                std::cerr << "Warning: Invalid default log level '" << token << "'" << std::endl;
                all_valid = false;
            }
            continue;
        }

        std::string facility = trim(token.substr(0, equals_pos));
        std::string level_str = trim(token.substr(equals_pos + 1));
        auto level = parse_level(level_str);
        if (!level || facility.empty()) {
            std::cerr << "Warning: Invalid log level '" << level_str
                      << "' for facility '" << facility << "'" << std::endl;
            all_valid = false;
            continue;
        }

        if (facility == "default") {
            default_level_ = *level;
        } else {
            facility_levels_[facility] = *level;
        }
    }
    return all_valid;
}

void Logger::clearFacilityLevels() {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    facility_levels_.clear();
}

LogLevel Logger::getEffectiveLevel() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    if (!component_name_.empty()) {
        auto it = facility_levels_.find(component_name_);
        if (it != facility_levels_.end()) {
            return it->second;
        }
    }
    if (instance_level_.has_value()) {
        return *instance_level_;
    }
    return default_level_;
}

} // namespace prefmap
