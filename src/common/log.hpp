#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace livegate::log {

// Component loggers
constexpr const char* MAIN_LOGGER = "livegate";
constexpr const char* SERVER_LOGGER = "server";
constexpr const char* RELAY_LOGGER = "relay";
constexpr const char* UPSTREAM_LOGGER = "upstream";
constexpr const char* AUTH_LOGGER = "auth";
constexpr const char* CONFIG_LOGGER = "config";

enum class Level {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

struct LogConfig {
    Level level{Level::Info};
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v"};
    bool console{true};
    std::string file_path;                   // Empty = no file sink
    size_t max_file_size{10 * 1024 * 1024};
    size_t max_files{5};
};

/**
 * Install sinks for every logger created from now on. Only the first call
 * after startup (or after shutdown()) takes effect.
 */
void init(const LogConfig& config = LogConfig{});

// LIVEGATE_LOG_LEVEL (fallback LOG_LEVEL) and LIVEGATE_LOG_FILE
void init_from_env();

// Unknown names map to Info
Level level_from_string(std::string_view name);

spdlog::level::level_enum to_spdlog_level(Level level);

// Logger by name, created on first use with the current sinks
std::shared_ptr<spdlog::logger> get(const std::string& name = MAIN_LOGGER);

void set_level(Level level);

Level get_level();

bool is_level_enabled(Level level);

// Flush and drop every logger
void shutdown();

template<typename... Args>
inline void write(const std::string& logger_name, Level level,
                  fmt::format_string<Args...> fmt, Args&&... args) {
    if (is_level_enabled(level)) {
        get(logger_name)->log(to_spdlog_level(level), fmt, std::forward<Args>(args)...);
    }
}

} // namespace livegate::log

#define LOG_TRACE(...) ::livegate::log::write(::livegate::log::MAIN_LOGGER, ::livegate::log::Level::Trace, __VA_ARGS__)
#define LOG_DEBUG(...) ::livegate::log::write(::livegate::log::MAIN_LOGGER, ::livegate::log::Level::Debug, __VA_ARGS__)
#define LOG_INFO(...) ::livegate::log::write(::livegate::log::MAIN_LOGGER, ::livegate::log::Level::Info, __VA_ARGS__)
#define LOG_WARN(...) ::livegate::log::write(::livegate::log::MAIN_LOGGER, ::livegate::log::Level::Warn, __VA_ARGS__)
#define LOG_ERROR(...) ::livegate::log::write(::livegate::log::MAIN_LOGGER, ::livegate::log::Level::Error, __VA_ARGS__)
#define LOG_CRITICAL(...) ::livegate::log::write(::livegate::log::MAIN_LOGGER, ::livegate::log::Level::Critical, __VA_ARGS__)

#define NLOG_TRACE(name, ...) ::livegate::log::write(name, ::livegate::log::Level::Trace, __VA_ARGS__)
#define NLOG_DEBUG(name, ...) ::livegate::log::write(name, ::livegate::log::Level::Debug, __VA_ARGS__)
#define NLOG_INFO(name, ...) ::livegate::log::write(name, ::livegate::log::Level::Info, __VA_ARGS__)
#define NLOG_WARN(name, ...) ::livegate::log::write(name, ::livegate::log::Level::Warn, __VA_ARGS__)
#define NLOG_ERROR(name, ...) ::livegate::log::write(name, ::livegate::log::Level::Error, __VA_ARGS__)
