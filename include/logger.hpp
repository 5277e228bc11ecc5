/**
 * @file logger.hpp
 * @brief Console logging for the SFTP writer.
 *
 * Writes timestamped lines to stdout (debug, info) and stderr (warning, error). An optional
 * sink receives every emitted record, which lets callers mirror log output elsewhere.
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <string>
#include <functional>
#include <format>
#include <utility>

/**
 * @brief Severity of a log record.
 */
enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

/**
 * @brief Process-wide logger.
 *
 * Debug records are dropped unless debug mode is enabled.
 */
class Logger {
public:
    using Sink = std::function<void(LogLevel, const std::string&)>;

    /**
     * @brief Enables or disables debug output.
     */
    static void setDebug(bool enabled);

    /**
     * @brief Returns true when debug output is enabled.
     */
    static bool debugEnabled();

    /**
     * @brief Installs a sink that receives each emitted record, or clears it with an empty function.
     *
     * @note The sink is called in addition to console output.
     */
    static void setSink(Sink sink);

    /**
     * @brief Emits a record at the given level.
     *
     * @param level Record severity.
     * @param message Message text, without timestamp or level prefix.
     */
    static void log(LogLevel level, const std::string& message);

    template <typename... Args>
    static void debug(std::format_string<Args...> fmt, Args&&... args) {
        if (debugEnabled()) {
            log(LogLevel::Debug, std::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    static void info(std::format_string<Args...> fmt, Args&&... args) {
        log(LogLevel::Info, std::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void warning(std::format_string<Args...> fmt, Args&&... args) {
        log(LogLevel::Warning, std::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void error(std::format_string<Args...> fmt, Args&&... args) {
        log(LogLevel::Error, std::format(fmt, std::forward<Args>(args)...));
    }
};

/**
 * @brief Returns the upper-case label used in log lines ("DEBUG", "INFO", ...).
 */
const char* logLevelLabel(LogLevel level);

#endif // LOGGER_HPP
