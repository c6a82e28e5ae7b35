// XRFrame Core
// logger.hpp - Category-based logging on top of spdlog

#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace xrframe::core {

class Config;

// Log levels matching spdlog for easy conversion
enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

// Maps "trace", "debug", "info", "warn", "error", "critical" and "off".
// Unknown names yield fallback.
[[nodiscard]] LogLevel parse_log_level(std::string_view name, LogLevel fallback = LogLevel::Info);

struct LoggerConfig {
    LogLevel console_level = LogLevel::Info;
    LogLevel file_level = LogLevel::Debug;
    std::filesystem::path log_file;              // Empty = console only
    size_t max_file_size = 5 * 1024 * 1024;      // 5 MB
    size_t max_files = 3;                         // Rotating backup count
    bool include_timestamps = true;

    // Levels and log file from the debug section (debug.log_level, debug.log_file)
    [[nodiscard]] static LoggerConfig from_config(const Config& config);
};

// Static logging interface
class Logger {
public:
    static void initialize(const LoggerConfig& config = {});
    static void shutdown();
    [[nodiscard]] static bool is_initialized();

    // Category-based level control
    static void set_category_level(std::string_view category, LogLevel level);
    [[nodiscard]] static LogLevel get_category_level(std::string_view category);

    // Global level (default for unconfigured categories)
    static void set_global_level(LogLevel level);
    [[nodiscard]] static LogLevel get_global_level();

    static void flush();

    template<typename... Args>
    static void trace(std::string_view category, fmt::format_string<Args...> fmt, Args&&... args) {
        log_impl(LogLevel::Trace, category, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void debug(std::string_view category, fmt::format_string<Args...> fmt, Args&&... args) {
        log_impl(LogLevel::Debug, category, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void info(std::string_view category, fmt::format_string<Args...> fmt, Args&&... args) {
        log_impl(LogLevel::Info, category, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void warn(std::string_view category, fmt::format_string<Args...> fmt, Args&&... args) {
        log_impl(LogLevel::Warn, category, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void error(std::string_view category, fmt::format_string<Args...> fmt, Args&&... args) {
        log_impl(LogLevel::Error, category, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void critical(std::string_view category, fmt::format_string<Args...> fmt, Args&&... args) {
        log_impl(LogLevel::Critical, category, fmt, std::forward<Args>(args)...);
    }

private:
    Logger() = delete;  // Static-only class

    template<typename... Args>
    static void log_impl(LogLevel level, std::string_view category,
                         fmt::format_string<Args...> fmt, Args&&... args) {
        if (!should_log(level, category)) {
            return;
        }
        auto message = fmt::format(fmt, std::forward<Args>(args)...);
        log_message(level, category, message);
    }

    [[nodiscard]] static bool should_log(LogLevel level, std::string_view category);
    static void log_message(LogLevel level, std::string_view category, std::string_view message);
};

namespace log_category {
    inline constexpr const char* CORE = "core";
    inline constexpr const char* XR = "xr";
    inline constexpr const char* SWAPCHAIN = "swapchain";
    inline constexpr const char* CONFIG = "config";
}  // namespace log_category

}  // namespace xrframe::core

#define XRFRAME_LOG_TRACE(category, ...) \
    ::xrframe::core::Logger::trace(category, __VA_ARGS__)

#define XRFRAME_LOG_DEBUG(category, ...) \
    ::xrframe::core::Logger::debug(category, __VA_ARGS__)

#define XRFRAME_LOG_INFO(category, ...) \
    ::xrframe::core::Logger::info(category, __VA_ARGS__)

#define XRFRAME_LOG_WARN(category, ...) \
    ::xrframe::core::Logger::warn(category, __VA_ARGS__)

#define XRFRAME_LOG_ERROR(category, ...) \
    ::xrframe::core::Logger::error(category, __VA_ARGS__)

#define XRFRAME_LOG_CRITICAL(category, ...) \
    ::xrframe::core::Logger::critical(category, __VA_ARGS__)
