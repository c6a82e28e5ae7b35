// XRFrame Core
// logger.cpp - Logging system implementation

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <xrframe/core/config.hpp>
#include <xrframe/core/logger.hpp>

namespace xrframe::core {

namespace {

struct LoggerState {
    bool initialized = false;
    LogLevel global_level = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> category_levels;
    std::shared_ptr<spdlog::logger> console_logger;
    std::shared_ptr<spdlog::logger> file_logger;
    std::mutex mutex;
};

LoggerState& get_state() {
    static LoggerState state;
    return state;
}

spdlog::level::level_enum to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:
            return spdlog::level::trace;
        case LogLevel::Debug:
            return spdlog::level::debug;
        case LogLevel::Info:
            return spdlog::level::info;
        case LogLevel::Warn:
            return spdlog::level::warn;
        case LogLevel::Error:
            return spdlog::level::err;
        case LogLevel::Critical:
            return spdlog::level::critical;
        case LogLevel::Off:
            return spdlog::level::off;
        default:
            return spdlog::level::info;
    }
}

LogLevel lookup_level(const LoggerState& state, std::string_view category) {
    auto it = state.category_levels.find(std::string(category));
    if (it != state.category_levels.end()) {
        return it->second;
    }
    return state.global_level;
}

}  // namespace

LogLevel parse_log_level(std::string_view name, LogLevel fallback) {
    static constexpr std::array<std::pair<std::string_view, LogLevel>, 8> kNames = {{
        {"trace", LogLevel::Trace},
        {"debug", LogLevel::Debug},
        {"info", LogLevel::Info},
        {"warn", LogLevel::Warn},
        {"warning", LogLevel::Warn},
        {"error", LogLevel::Error},
        {"critical", LogLevel::Critical},
        {"off", LogLevel::Off},
    }};

    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto& [key, level] : kNames) {
        if (key == lowered) {
            return level;
        }
    }
    return fallback;
}

LoggerConfig LoggerConfig::from_config(const Config& config) {
    LoggerConfig logger_config;

    std::string level_name = config.get_string(config_section::DEBUG, config_key::LOG_LEVEL, "info");
    LogLevel level = parse_log_level(level_name, logger_config.console_level);
    logger_config.console_level = level;
    // The file sink never records less than the console
    logger_config.file_level = std::min(level, logger_config.file_level);

    std::string log_file = config.get_string(config_section::DEBUG, config_key::LOG_FILE);
    if (!log_file.empty()) {
        logger_config.log_file = log_file;
    }
    return logger_config;
}

void Logger::initialize(const LoggerConfig& config) {
    auto& state = get_state();
    std::filesystem::path log_path;

    {
        std::lock_guard lock(state.mutex);

        if (state.initialized) {
            return;
        }

        try {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(to_spdlog_level(config.console_level));

            if (config.include_timestamps) {
                console_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
            } else {
                console_sink->set_pattern("[%^%l%$] %v");
            }

            state.console_logger = std::make_shared<spdlog::logger>("xrframe", console_sink);
            state.console_logger->set_level(spdlog::level::trace);  // Let sink filter
            state.console_logger->flush_on(spdlog::level::warn);

            if (!config.log_file.empty()) {
                log_path = config.log_file;
                auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    log_path.string(), config.max_file_size, config.max_files);
                file_sink->set_level(to_spdlog_level(config.file_level));
                file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [thread %t] %v");

                state.file_logger = std::make_shared<spdlog::logger>("xrframe_file", file_sink);
                state.file_logger->set_level(spdlog::level::trace);
                state.file_logger->flush_on(spdlog::level::info);
            }

            state.global_level = std::min(config.console_level, config.file_level);
            state.initialized = true;

        } catch (const spdlog::spdlog_ex& ex) {
            // Fall back to console-only output if the file sink cannot be opened
            spdlog::error("Logger initialization failed: {}", ex.what());
            log_path.clear();

            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            state.console_logger = std::make_shared<spdlog::logger>("xrframe", console_sink);
            state.file_logger.reset();
            state.global_level = config.console_level;
            state.initialized = true;
        }
    }  // Lock released before logging

    debug(log_category::CORE, "Logger initialized");
    if (!log_path.empty()) {
        debug(log_category::CORE, "Log file: {}", log_path.string());
    }
}

void Logger::shutdown() {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);

    if (!state.initialized) {
        return;
    }

    if (state.console_logger) {
        state.console_logger->flush();
    }
    if (state.file_logger) {
        state.file_logger->flush();
    }

    state.console_logger.reset();
    state.file_logger.reset();
    state.category_levels.clear();
    state.global_level = LogLevel::Info;
    state.initialized = false;
}

bool Logger::is_initialized() {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);
    return state.initialized;
}

void Logger::set_category_level(std::string_view category, LogLevel level) {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);
    state.category_levels[std::string(category)] = level;
}

LogLevel Logger::get_category_level(std::string_view category) {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);
    return lookup_level(state, category);
}

void Logger::set_global_level(LogLevel level) {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);
    state.global_level = level;

    if (state.console_logger) {
        for (auto& sink : state.console_logger->sinks()) {
            sink->set_level(to_spdlog_level(level));
        }
    }
}

LogLevel Logger::get_global_level() {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);
    return state.global_level;
}

void Logger::flush() {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);

    if (state.console_logger) {
        state.console_logger->flush();
    }
    if (state.file_logger) {
        state.file_logger->flush();
    }
}

bool Logger::should_log(LogLevel level, std::string_view category) {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);

    if (!state.initialized) {
        // spdlog's default logger applies its own level before initialize()
        return true;
    }

    return static_cast<int>(level) >= static_cast<int>(lookup_level(state, category));
}

void Logger::log_message(LogLevel level, std::string_view category, std::string_view message) {
    auto& state = get_state();
    auto spdlog_level = to_spdlog_level(level);

    std::lock_guard lock(state.mutex);

    if (!state.initialized) {
        spdlog::log(spdlog_level, "[{}] {}", category, message);
        return;
    }

    if (state.console_logger) {
        state.console_logger->log(spdlog_level, "[{}] {}", category, message);
    }
    if (state.file_logger) {
        state.file_logger->log(spdlog_level, "[{}] {}", category, message);
    }
}

}  // namespace xrframe::core
