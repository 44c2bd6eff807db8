/**
 * @file Logger.hpp
 * @brief Centralized logging with per-facility verbosity control
 *
 * All diagnostic output of the renderer goes through Logger::outputMessage().
 * Messages are written to std::cerr (stdout may carry image bytes) and,
 * optionally, appended to a log file shared by every logger instance.
 */

#pragma once

#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace prefmap {

/**
 * @brief Log levels
 *
 * Level 1: Errors (request or program fails)
 * Level 2: Warnings (fallback behavior taken)
 * Level 3: Information (high-level)
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

/// Short tag printed in front of each message
const char* log_level_tag(LogLevel level);

/**
 * @brief Facility logger
 *
 * The component name passed at construction is the facility. Its level comes
 * from the facility registry, then from the instance override, then from the
 * global default.
 */
class Logger {
public:
    Logger();

    /**
     * @brief Constructor with component (facility) name
     * @param component_name Name shown in each message and used for level lookup
     */
    explicit Logger(const std::string& component_name);

    /**
     * @brief Output a message if it meets the effective verbosity level
     *
     * Single point of logging control: one verbosity check, one write.
     */
    void outputMessage(LogLevel level, const std::string& message) const;

    /// Per-instance override (takes precedence over the global default)
    void setLogLevel(LogLevel level) { instance_level_ = level; }

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

    /// Flush console and log file
    void flush() const;

    const std::string& component() const { return component_name_; }

    // ========================================================================
    // Facility registry
    // ========================================================================

    /**
     * @brief Set log level for one facility
     *
     * @example
     * Logger::setFacilityLevel("SceneRasterizer", LogLevel::TRACE);
     */
    static void setFacilityLevel(const std::string& facility, LogLevel level);

    /// Fallback level for facilities without a specific level
    static void setDefaultLevel(LogLevel level);

    static LogLevel getFacilityLevel(const std::string& facility);

    /**
     * @brief Parse and apply a log configuration string
     *
     * Formats:
     * - "5" sets the default to DEBUG
     * - "MapServer=6,SceneRasterizer=4" sets facility levels
     * - "3,GeoDatasetLoader=6" mixes both; "default=4" is an alias of "4"
     *
     * Levels are clamped to [1, 6].
     * @return false if any token could not be parsed (valid tokens still apply)
     */
    static bool parseLogConfig(const std::string& config);

    static void clearFacilityLevels();

    /**
     * @brief Route all loggers to an append-mode file in addition to stderr
     * @param path Log file path, or nullopt to stop file logging
     * @return false if the file could not be opened
     */
    static bool setLogFile(const std::optional<std::string>& path);

    LogLevel getEffectiveLevel() const;

private:
    std::string component_name_;
    std::optional<LogLevel> instance_level_;

    static std::unordered_map<std::string, LogLevel> facility_levels_;
    static LogLevel default_level_;
    static std::mutex registry_mutex_;

    static std::shared_ptr<std::ofstream> file_stream_;
    static std::mutex output_mutex_;

    void doOutput(LogLevel level, const std::string& message) const;
};

} // namespace prefmap
