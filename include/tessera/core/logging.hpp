/**
 * @file logging.hpp
 * @brief Thread-safe logging system for Tessera
 *
 * This file provides a comprehensive logging system with multiple severity
 * levels, colored console output, file output, and thread-safe operation.
 * Uses {fmt} for type-safe formatted output (compile-time checked format
 * strings, same syntax as std::format) uwu
 *
 * Design decisions:
 * - Thread-safe logging with mutex (no data races)
 * - Console output on stderr, colored when it is a terminal
 * - Optional file output (logs/tessera.log), switchable at runtime
 * - Lock-free runtime level filtering, checked before arguments are formatted
 * - Format string validation at compile time (fmt::format_string)
 *
 * @author LukeFrankio
 * @date 2025-10-07
 * @version 1.0
 *
 * @note Thread-safe implementation (mutex-protected global state)
 */

#pragma once

#include <tessera/core/types.hpp>

#include <fmt/format.h>

#include <atomic>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

namespace tessera {

// ============================================================================
// Log Level Enumeration
// ============================================================================

/**
 * @enum LogLevel
 * @brief Severity levels for log messages
 *
 * Ordered from least to most severe. Messages are only logged if their
 * level is >= the current minimum log level.
 */
enum class LogLevel : u8 {
    TRACE = 0,  ///< Trace: very detailed debug information
    DEBUG = 1,  ///< Debug: general debug information
    INFO = 2,   ///< Info: informational messages
    WARN = 3,   ///< Warning: something unexpected but recoverable
    ERROR = 4,  ///< Error: operation failed but program continues
    FATAL = 5   ///< Fatal: critical error, program should terminate
};

/**
 * @brief Converts log level to string
 *
 * ✨ PURE FUNCTION ✨
 *
 * @param level Log level
 * @return String representation of level
 */
[[nodiscard]] constexpr auto to_string(LogLevel level) noexcept -> std::string_view {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
    }
    return "UNKNOWN";
}

/**
 * @brief Parses a log level name (case-insensitive)
 *
 * ✨ PURE FUNCTION ✨
 *
 * @param name Level name such as "info" or "WARN"
 * @return Matching level, or nullopt for unknown names
 */
[[nodiscard]] auto parse_log_level(std::string_view name) noexcept -> std::optional<LogLevel>;

/**
 * @enum ColorMode
 * @brief When console lines get ANSI colors
 */
enum class ColorMode : u8 {
    AUTO = 0,    ///< Only when stderr is a terminal
    ALWAYS = 1,  ///< Always
    NEVER = 2    ///< Never (plain text, e.g. CI logs)
};

/**
 * @brief Parses a color mode name ("auto", "always", "never")
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto parse_color_mode(std::string_view name) noexcept -> std::optional<ColorMode>;

// ============================================================================
// Logger Class (singleton with thread-safe access)
// ============================================================================

/**
 * @class Logger
 * @brief Thread-safe process-wide logger
 *
 * Console lines go to stderr (the library never writes to stdout, which
 * belongs to the embedding program). An optional file sink receives every
 * line without colors and with the full source location.
 *
 * ⚠️ IMPURE CLASS (has side effects)
 *
 * Side effects:
 * - Writes to stderr
 * - Writes to the log file (when one is open)
 * - Modifies global state (log level, file handle)
 *
 * @note Singleton pattern used for global access (not ideal but pragmatic)
 * @note The level check is lock-free; sinks are mutex-protected
 */
class Logger {
public:
    /**
     * @brief Gets singleton instance
     *
     * ⚠️ IMPURE FUNCTION (returns reference to global state)
     */
    static auto instance() -> Logger&;

    /**
     * @brief Opens (or switches to) a log file
     *
     * ⚠️ IMPURE FUNCTION (file I/O)
     *
     * Missing parent directories are created. Calling it again with the
     * same path is a no-op; a different path closes the current file first.
     *
     * @param log_file_path Path to log file (default: "logs/tessera.log")
     * @return Success or CORE_FILE_IO_ERROR
     */
    auto initialize(std::string_view log_file_path = "logs/tessera.log") -> Result<void>;

    /**
     * @brief Closes the log file; console logging continues
     *
     * ⚠️ IMPURE FUNCTION (file I/O)
     */
    auto shutdown() -> void;

    /**
     * @brief Path of the open log file (empty when console only)
     */
    [[nodiscard]] auto log_file_path() const -> std::string;

    /**
     * @brief Sets minimum log level
     *
     * @param level Minimum log level (messages below this are ignored)
     */
    auto set_level(LogLevel level) noexcept -> void;

    /**
     * @brief Gets current minimum log level
     */
    [[nodiscard]] auto get_level() const noexcept -> LogLevel;

    /**
     * @brief Checks whether a message at this level would be written
     *
     * Lets hot paths skip building expensive arguments (hex dumps of words).
     */
    [[nodiscard]] auto should_log(LogLevel level) const noexcept -> bool {
        return level >= get_level();
    }

    auto set_color_mode(ColorMode mode) -> void;

    /**
     * @brief Logs a message with format string
     *
     * ⚠️ IMPURE FUNCTION (I/O operations)
     *
     * @tparam Args Format argument types
     * @param level Log level
     * @param location Source location (automatic via std::source_location)
     * @param format Format string ({fmt} compatible)
     * @param args Format arguments
     */
    template<typename... Args>
    auto log(LogLevel level,
             const std::source_location& location,
             fmt::format_string<Args...> format,
             Args&&... args) -> void {
        if (!should_log(level)) {
            return;
        }
        write(level, location, fmt::format(format, std::forward<Args>(args)...));
    }

    // Delete copy and move (singleton)
    Logger(const Logger&) = delete;
    auto operator=(const Logger&) -> Logger& = delete;
    Logger(Logger&&) = delete;
    auto operator=(Logger&&) -> Logger& = delete;

private:
    Logger();
    ~Logger();

    auto write(LogLevel level, const std::source_location& location, std::string_view message)
        -> void;

    struct Impl;
    std::unique_ptr<Impl> impl_;              ///< Sinks (pimpl idiom)
    std::atomic<LogLevel> min_level_{LogLevel::INFO};
};

} // namespace tessera

// ============================================================================
// Logging Macros (convenient wrappers with source location)
// ============================================================================

/**
 * @def TESSERA_LOG
 * @brief Logs at a level, evaluating the format arguments only when it passes
 *        the level filter
 */
#define TESSERA_LOG(level, ...)                                                  \
    do {                                                                         \
        auto& tessera_logger_ = ::tessera::Logger::instance();                   \
        if (tessera_logger_.should_log(level)) {                                 \
            tessera_logger_.log(level, std::source_location::current(), __VA_ARGS__); \
        }                                                                        \
    } while (false)

/**
 * @def LOG_TRACE
 * @brief Logs trace message
 *
 * Usage: LOG_TRACE("slot {} = {}", address.to_hex(), value.to_hex());
 */
#define LOG_TRACE(...) TESSERA_LOG(::tessera::LogLevel::TRACE, __VA_ARGS__)

/**
 * @def LOG_DEBUG
 * @brief Logs debug message
 *
 * Usage: LOG_DEBUG("Wrote {} values for model {}", count, name);
 */
#define LOG_DEBUG(...) TESSERA_LOG(::tessera::LogLevel::DEBUG, __VA_ARGS__)

/**
 * @def LOG_INFO
 * @brief Logs info message
 *
 * Usage: LOG_INFO("Registered model {}", tag);
 */
#define LOG_INFO(...) TESSERA_LOG(::tessera::LogLevel::INFO, __VA_ARGS__)

/**
 * @def LOG_WARN
 * @brief Logs warning message
 *
 * Usage: LOG_WARN("Rejected write from {}", caller.to_hex());
 */
#define LOG_WARN(...) TESSERA_LOG(::tessera::LogLevel::WARN, __VA_ARGS__)

/**
 * @def LOG_ERROR
 * @brief Logs error message
 *
 * Usage: LOG_ERROR("Failed to load file: {}", filename);
 */
#define LOG_ERROR(...) TESSERA_LOG(::tessera::LogLevel::ERROR, __VA_ARGS__)

/**
 * @def LOG_FATAL
 * @brief Logs fatal error message
 *
 * Usage: LOG_FATAL("Storage backend unreachable");
 */
#define LOG_FATAL(...) TESSERA_LOG(::tessera::LogLevel::FATAL, __VA_ARGS__)
