#ifndef PIIGUARD_UTIL_LOGGER_HPP
#define PIIGUARD_UTIL_LOGGER_HPP

#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <mutex>
#include <memory>
#include <iomanip>
#include <chrono>
#include <ctime>
#include <stdexcept>
#include <algorithm>
#include <cctype>

/**
 * @file logger.hpp
 * @brief A thread-safe logging utility for piiguard.
 *
 * Console output goes to stderr so that redacted text or reports written to
 * stdout by the CLI are never interleaved with log lines.
 *
 * Usage:
 *   - Logger::getInstance().info("Scanner: 3 rules loaded");
 *   - logger::debug("Resolver: dropped 2 subsumed matches");
 *   - logger::enableFileOutput("piiguard.log");
 *   - logger::setConsoleOutput(false); // e.g. in unit tests
 */

namespace piiguard {
namespace util {
namespace logger {

/**
 * @brief Enumeration of log levels.
 */
enum class LogLevel {
    DEBUG = 0,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

/**
 * @brief Parse a level name (case-insensitive): debug, info, warn, error, critical.
 * @throw std::invalid_argument for anything else.
 */
inline LogLevel parseLogLevel(const std::string &name)
{
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "critical") return LogLevel::CRITICAL;
    throw std::invalid_argument("logger: unknown log level '" + name + "'");
}

inline const char* levelName(LogLevel level)
{
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
    }
    return "UNKNOWN";
}

/**
 * @brief Process-wide logger. Every sink write happens under one mutex, so
 *        lines from concurrent scans never interleave.
 *
 * Sinks: stderr (on by default, switchable) and an optional file.
 */
class Logger {
public:
    static Logger& getInstance()
    {
        static Logger instance;
        return instance;
    }

    /**
     * @brief Messages below @p level are discarded.
     */
    void setLogLevel(LogLevel level)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        threshold_ = level;
    }

    LogLevel getLogLevel() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return threshold_;
    }

    /**
     * @brief True if a message at @p level would be written.
     *        Lets callers skip building expensive DEBUG strings.
     */
    bool isEnabled(LogLevel level) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return level >= threshold_;
    }

    /**
     * @brief Also write to @p filename. A file that cannot be opened is
     *        reported on stderr and logging continues without it.
     */
    void enableFileOutput(const std::string &filename, bool append = false)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto mode = std::ios::out | (append ? std::ios::app : std::ios::trunc);
        auto file = std::make_unique<std::ofstream>(filename, mode);
        if (!file->is_open()) {
            std::cerr << "[Logger] Failed to open log file: " << filename << std::endl;
            return;
        }
        file_ = std::move(file);
    }

    void disableFileOutput()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        file_.reset();
    }

    /**
     * @brief Turn the stderr sink on or off. The file sink is unaffected.
     */
    void setConsoleOutput(bool enabled)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        console_ = enabled;
    }

    void debug(const std::string &msg) { write(LogLevel::DEBUG, msg); }
    void info(const std::string &msg) { write(LogLevel::INFO, msg); }
    void warn(const std::string &msg) { write(LogLevel::WARN, msg); }
    void error(const std::string &msg) { write(LogLevel::ERROR, msg); }
    void critical(const std::string &msg) { write(LogLevel::CRITICAL, msg); }

    /**
     * @brief Format "[YYYY-mm-dd HH:MM:SS][LEVEL] msg" and send it to every open sink.
     */
    void write(LogLevel level, const std::string &msg)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < threshold_ || (!console_ && !file_)) {
            return;
        }

        std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm local{};
#ifdef _WIN32
        localtime_s(&local, &now);
#else
        localtime_r(&now, &local);
#endif
        std::ostringstream line;
        line << "[" << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << "]["
             << levelName(level) << "] " << msg << "\n";

        const std::string text = line.str();
        if (console_) {
            std::cerr << text << std::flush;
        }
        if (file_) {
            *file_ << text << std::flush;
        }
    }

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    mutable std::mutex mutex_;
    LogLevel threshold_ = LogLevel::INFO;
    bool console_ = true;
    std::unique_ptr<std::ofstream> file_;
};

// ----------------------------------------------------------------------------
//  Convenience free functions (shortcuts)
// ----------------------------------------------------------------------------
inline void setLogLevel(LogLevel level)
{
    Logger::getInstance().setLogLevel(level);
}

inline bool isEnabled(LogLevel level)
{
    return Logger::getInstance().isEnabled(level);
}

inline void enableFileOutput(const std::string &filename, bool append = false)
{
    Logger::getInstance().enableFileOutput(filename, append);
}

inline void disableFileOutput()
{
    Logger::getInstance().disableFileOutput();
}

inline void setConsoleOutput(bool enabled)
{
    Logger::getInstance().setConsoleOutput(enabled);
}

inline void debug(const std::string &msg)
{
    Logger::getInstance().debug(msg);
}

inline void info(const std::string &msg)
{
    Logger::getInstance().info(msg);
}

inline void warn(const std::string &msg)
{
    Logger::getInstance().warn(msg);
}

inline void error(const std::string &msg)
{
    Logger::getInstance().error(msg);
}

inline void critical(const std::string &msg)
{
    Logger::getInstance().critical(msg);
}

} // namespace logger
} // namespace util
} // namespace piiguard

#endif // PIIGUARD_UTIL_LOGGER_HPP
