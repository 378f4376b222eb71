/**
 * @file logger_adapter.hpp
 * @brief Adapter over logger_system for the transfer engine
 *
 * Provides a process-wide logging facade. Until initialize() is called all
 * log calls are dropped, so library code can log unconditionally.
 */

#pragma once

#include <xnat/compat/format.hpp>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace xnat::integration {

/**
 * @enum log_level
 * @brief Log severity levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5,
    off = 6
};

/**
 * @brief Parse a log level name ("debug", "WARN", ...)
 * @return Parsed level, or info if the name is not recognised
 */
[[nodiscard]] auto log_level_from_string(std::string_view name) noexcept -> log_level;

// ─────────────────────────────────────────────────────
// Configuration
// ─────────────────────────────────────────────────────

/**
 * @struct logger_config
 * @brief Configuration options for the logger adapter
 */
struct logger_config {
    /// Directory for log files
    std::filesystem::path log_directory{"logs"};

    /// File name inside log_directory
    std::string file_name{"xnat_transfer.log"};

    /// Minimum log level to output
    log_level min_level{log_level::info};

    /// Enable console output
    bool enable_console{true};

    /// Enable file output
    bool enable_file{false};

    /// Maximum log file size in megabytes before rotation
    std::size_t max_file_size_mb{50};

    /// Maximum number of rotated log files to keep
    std::size_t max_files{5};

    /// Use asynchronous logging; transfer workers should not block on I/O
    bool async_mode{true};

    /// Buffer size for async logging
    std::size_t buffer_size{8192};
};

// ─────────────────────────────────────────────────────
// Logger Adapter Class
// ─────────────────────────────────────────────────────

/**
 * @class logger_adapter
 * @brief Static facade over kcenon::logger::logger
 *
 * Thread Safety: all methods are thread-safe.
 */
class logger_adapter {
public:
    static void initialize(const logger_config& config);

    static void shutdown();

    [[nodiscard]] static auto is_initialized() noexcept -> bool;

    template <typename... Args>
    static void debug(xnat::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::debug, xnat::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void info(xnat::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::info, xnat::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void warn(xnat::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::warn, xnat::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void error(xnat::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::error, xnat::compat::format(fmt, std::forward<Args>(args)...));
    }

    static void log(log_level level, const std::string& message);

    [[nodiscard]] static auto is_level_enabled(log_level level) noexcept -> bool;

    static void flush();

    static void set_min_level(log_level level);

    [[nodiscard]] static auto get_min_level() noexcept -> log_level;

    [[nodiscard]] static auto log_level_to_string(log_level level) -> std::string;

private:
    class impl;
    static std::unique_ptr<impl> pimpl_;
};

}  // namespace xnat::integration
