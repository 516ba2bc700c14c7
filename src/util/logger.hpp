#ifndef MEDIGUARD_UTIL_LOGGER_HPP
#define MEDIGUARD_UTIL_LOGGER_HPP

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
#include <cctype>

/**
 * @file logger.hpp
 * @brief A thread-safe logging utility for the MediGuard chain service.
 *
 * Usage:
 *   - Logger::getInstance().info("[HashChainLedger] appended entry 42");
 *   - logger::warn("[AnchorCommitter] commit failed, retrying next cycle");
 *   - logger::enableFileOutput("mediguard_chain.log", true);
 *
 * WARN and above go to stderr, everything else to stdout. Timestamps are UTC
 * so log lines from several hosts sort together.
 */

namespace mediguard {
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
 * @brief Parse a level name ("debug", "INFO", "warn", ...) as used in config files.
 * @throw std::invalid_argument for an unknown name.
 */
inline LogLevel parseLogLevel(const std::string &name)
{
    std::string upper;
    upper.reserve(name.size());
    for (char c : name) {
        upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    if (upper == "DEBUG")    return LogLevel::DEBUG;
    if (upper == "INFO")     return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR")    return LogLevel::ERROR;
    if (upper == "CRITICAL") return LogLevel::CRITICAL;
    throw std::invalid_argument("unknown log level '" + name + "'");
}

/**
 * @brief A singleton logger class that supports:
 *  - Thread-safe logging
 *  - Various log levels
 *  - Optional file output (in addition to the console)
 */
class Logger {
public:
    /**
     * @brief Get the global Logger instance.
     */
    static Logger& getInstance()
    {
        static Logger instance;
        return instance;
    }

    /**
     * @brief Set the minimal log level. Messages below this level are discarded.
     */
    void setLogLevel(LogLevel level)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        logLevel_ = level;
    }

    LogLevel getLogLevel() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return logLevel_;
    }

    /**
     * @brief Enable output to a file.
     * @param filename The file path to write logs into.
     * @param append If true, appends to existing file; otherwise overwrites.
     * @return false if the file could not be opened (console logging continues).
     */
    bool enableFileOutput(const std::string &filename, bool append = true)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fileStream_) {
            fileStream_->close();
        }
        fileStream_ = std::make_unique<std::ofstream>(filename,
            append ? (std::ios::out | std::ios::app) : (std::ios::out | std::ios::trunc));
        if (!fileStream_->is_open()) {
            fileStream_.reset();
            std::cerr << "[Logger] Failed to open log file: " << filename << std::endl;
            return false;
        }
        return true;
    }

    void disableFileOutput()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fileStream_) {
            fileStream_->close();
            fileStream_.reset();
        }
    }

    void debug(const std::string &msg)    { log(LogLevel::DEBUG, "DEBUG", msg); }
    void info(const std::string &msg)     { log(LogLevel::INFO, "INFO", msg); }
    void warn(const std::string &msg)     { log(LogLevel::WARN, "WARN", msg); }
    void error(const std::string &msg)    { log(LogLevel::ERROR, "ERROR", msg); }
    void critical(const std::string &msg) { log(LogLevel::CRITICAL, "CRITICAL", msg); }

private:
    Logger()
        : logLevel_(LogLevel::INFO)
    {
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Core logging function that writes to console and optionally to a file.
     */
    void log(LogLevel level, const char *levelName, const std::string &msg)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < logLevel_) {
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()).count() % 1000;
        std::tm tm_buf{};
#ifdef _WIN32
        gmtime_s(&tm_buf, &time_t_now);
#else
        gmtime_r(&time_t_now, &tm_buf);
#endif
        std::ostringstream line;
        line << "[" << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
             << "." << std::setw(3) << std::setfill('0') << millis << "Z]"
             << "[" << levelName << "] " << msg << '\n';
        const std::string text = line.str();

        std::ostream &out = (level >= LogLevel::WARN) ? std::cerr : std::cout;
        out << text;
        out.flush();

        if (fileStream_) {
            (*fileStream_) << text;
            fileStream_->flush();
        }
    }

    mutable std::mutex mutex_;
    LogLevel logLevel_;
    std::unique_ptr<std::ofstream> fileStream_;
};

// ----------------------------------------------------------------------------
//  Convenience free functions (shortcuts)
// ----------------------------------------------------------------------------
inline void setLogLevel(LogLevel level)
{
    Logger::getInstance().setLogLevel(level);
}

inline bool enableFileOutput(const std::string &filename, bool append = true)
{
    return Logger::getInstance().enableFileOutput(filename, append);
}

inline void debug(const std::string &msg)    { Logger::getInstance().debug(msg); }
inline void info(const std::string &msg)     { Logger::getInstance().info(msg); }
inline void warn(const std::string &msg)     { Logger::getInstance().warn(msg); }
inline void error(const std::string &msg)    { Logger::getInstance().error(msg); }
inline void critical(const std::string &msg) { Logger::getInstance().critical(msg); }

} // namespace logger
} // namespace util
} // namespace mediguard

#endif // MEDIGUARD_UTIL_LOGGER_HPP
