/**
 * @file logging.cpp
 * @brief Implementation of thread-safe logging system
 *
 * @author LukeFrankio
 * @date 2025-10-07
 */

#include <tessera/core/logging.hpp>

#include <fmt/chrono.h>
#include <fmt/std.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <thread>

#include <unistd.h>

namespace tessera {

// ============================================================================
// ANSI Color Codes (for colored console output)
// ============================================================================

namespace ansi {
constexpr auto RESET = "\033[0m";
constexpr auto BOLD_RED = "\033[1;91m";

constexpr auto BRIGHT_BLACK = "\033[90m";
constexpr auto BRIGHT_RED = "\033[91m";
constexpr auto BRIGHT_GREEN = "\033[92m";
constexpr auto BRIGHT_YELLOW = "\033[93m";
constexpr auto BRIGHT_CYAN = "\033[96m";
} // namespace ansi

namespace {

auto to_upper(std::string_view text) -> std::string {
    std::string upper(text);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return upper;
}

[[nodiscard]] auto level_color(LogLevel level) noexcept -> const char* {
    switch (level) {
        case LogLevel::TRACE: return ansi::BRIGHT_BLACK;
        case LogLevel::DEBUG: return ansi::BRIGHT_CYAN;
        case LogLevel::INFO:  return ansi::BRIGHT_GREEN;
        case LogLevel::WARN:  return ansi::BRIGHT_YELLOW;
        case LogLevel::ERROR: return ansi::BRIGHT_RED;
        case LogLevel::FATAL: return ansi::BOLD_RED;
    }
    return "";
}

/**
 * @brief Local wall-clock time with milliseconds
 */
[[nodiscard]] auto timestamp() -> std::string {
    const auto now = std::chrono::system_clock::now();
    const auto time_t_now = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&time_t_now, &tm_buf);
    return fmt::format("{:%Y-%m-%d %H:%M:%S}.{:03d}", tm_buf, static_cast<int>(ms.count()));
}

/**
 * @brief File name without its directories, for the short console form
 */
[[nodiscard]] auto base_name(std::string_view path) noexcept -> std::string_view {
    const auto slash = path.find_last_of('/');
    return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

} // anonymous namespace

auto parse_log_level(std::string_view name) noexcept -> std::optional<LogLevel> {
    const auto upper = to_upper(name);
    for (const auto level : {LogLevel::TRACE, LogLevel::DEBUG, LogLevel::INFO,
                             LogLevel::WARN, LogLevel::ERROR, LogLevel::FATAL}) {
        if (upper == to_string(level)) {
            return level;
        }
    }
    return std::nullopt;
}

auto parse_color_mode(std::string_view name) noexcept -> std::optional<ColorMode> {
    const auto upper = to_upper(name);
    if (upper == "AUTO") {
        return ColorMode::AUTO;
    }
    if (upper == "ALWAYS") {
        return ColorMode::ALWAYS;
    }
    if (upper == "NEVER") {
        return ColorMode::NEVER;
    }
    return std::nullopt;
}

// ============================================================================
// Logger Implementation (pimpl idiom for encapsulation)
// ============================================================================

struct Logger::Impl {
    mutable std::mutex mutex;        ///< Guards both sinks
    std::ofstream file;              ///< File sink (closed = console only)
    std::string file_path;           ///< Path of the open file sink
    bool colors = isatty(STDERR_FILENO) != 0;

    /**
     * @brief Writes one line to both sinks
     *
     * @pre mutex is held by the caller
     */
    auto emit(LogLevel level, const std::source_location& location, std::string_view message)
        -> void {
        const auto time = timestamp();
        const auto thread_id = std::this_thread::get_id();

        // [12:00:00.000] WARN  engine.cpp:88 Rejected write ...
        const auto console_line = fmt::format(
            "{}[{}] {:<5} {}:{} {}{}\n",
            colors ? level_color(level) : "",
            time,
            to_string(level),
            base_name(location.file_name()),
            location.line(),
            message,
            colors ? ansi::RESET : "");
        std::fputs(console_line.c_str(), stderr);
        std::fflush(stderr);

        if (file.is_open()) {
            file << fmt::format("[{}] [{}] [Thread {}] {} ({}:{}): {}\n",
                                time,
                                to_string(level),
                                thread_id,
                                location.function_name(),
                                location.file_name(),
                                location.line(),
                                message)
                 << std::flush;
        }
    }

    /**
     * @pre mutex is held by the caller
     */
    auto close_file() -> void {
        if (file.is_open()) {
            emit(LogLevel::INFO, std::source_location::current(),
                 fmt::format("Closing log file {}", file_path));
            file.close();
        }
        file_path.clear();
    }
};

// ============================================================================
// Logger Public Methods
// ============================================================================

Logger::Logger() : impl_(std::make_unique<Impl>()) {}

Logger::~Logger() = default;

auto Logger::instance() -> Logger& {
    static Logger instance;
    return instance;
}

auto Logger::initialize(std::string_view log_file_path) -> Result<void> {
    std::lock_guard lock(impl_->mutex);

    if (impl_->file.is_open() && impl_->file_path == log_file_path) {
        return {};
    }
    impl_->close_file();

    const auto log_path = std::filesystem::path(log_file_path);
    const auto log_dir = log_path.parent_path();
    if (!log_dir.empty() && !std::filesystem::exists(log_dir)) {
        std::error_code ec;
        if (!std::filesystem::create_directories(log_dir, ec)) {
            return make_error(ErrorCode::CORE_FILE_IO_ERROR,
                              fmt::format("Failed to create log directory {}: {}",
                                          log_dir.string(), ec.message()));
        }
    }

    impl_->file.open(log_path, std::ios::out | std::ios::app);
    if (!impl_->file.is_open()) {
        return make_error(ErrorCode::CORE_FILE_IO_ERROR,
                          fmt::format("Failed to open log file: {}", log_file_path));
    }
    impl_->file_path = std::string(log_file_path);

    impl_->emit(LogLevel::INFO, std::source_location::current(),
                fmt::format("Logging to {}", log_file_path));
    return {};
}

auto Logger::shutdown() -> void {
    std::lock_guard lock(impl_->mutex);
    impl_->close_file();
}

auto Logger::log_file_path() const -> std::string {
    std::lock_guard lock(impl_->mutex);
    return impl_->file_path;
}

auto Logger::set_level(LogLevel level) noexcept -> void {
    min_level_.store(level, std::memory_order_relaxed);
}

auto Logger::get_level() const noexcept -> LogLevel {
    return min_level_.load(std::memory_order_relaxed);
}

auto Logger::set_color_mode(ColorMode mode) -> void {
    std::lock_guard lock(impl_->mutex);
    switch (mode) {
        case ColorMode::AUTO:   impl_->colors = isatty(STDERR_FILENO) != 0; break;
        case ColorMode::ALWAYS: impl_->colors = true; break;
        case ColorMode::NEVER:  impl_->colors = false; break;
    }
}

auto Logger::write(LogLevel level, const std::source_location& location,
                   std::string_view message) -> void {
    std::lock_guard lock(impl_->mutex);
    impl_->emit(level, location, message);
}

} // namespace tessera
