#include "common/log.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace livegate::log {

namespace {

struct Registry {
    std::mutex mutex;
    LogConfig config;
    std::vector<spdlog::sink_ptr> sinks;  // Shared by every logger
    std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> loggers;
    bool configured{false};
};

Registry& registry() {
    static Registry r;
    return r;
}

std::atomic<Level> g_level{Level::Info};

// Caller holds the registry mutex
void build_sinks(Registry& r) {
    r.sinks.clear();
    if (r.config.console) {
        r.sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }
    if (!r.config.file_path.empty()) {
        r.sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            r.config.file_path, r.config.max_file_size, r.config.max_files));
    }
    for (auto& sink : r.sinks) {
        sink->set_pattern(r.config.pattern);
    }
    r.configured = true;
}

} // anonymous namespace

Level level_from_string(std::string_view name) {
    std::string level(name);
    std::transform(level.begin(), level.end(), level.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (level == "trace") return Level::Trace;
    if (level == "debug") return Level::Debug;
    if (level == "warn" || level == "warning") return Level::Warn;
    if (level == "error" || level == "err") return Level::Error;
    if (level == "critical" || level == "fatal") return Level::Critical;
    if (level == "off") return Level::Off;
    return Level::Info;
}

spdlog::level::level_enum to_spdlog_level(Level level) {
    switch (level) {
        case Level::Trace: return spdlog::level::trace;
        case Level::Debug: return spdlog::level::debug;
        case Level::Info: return spdlog::level::info;
        case Level::Warn: return spdlog::level::warn;
        case Level::Error: return spdlog::level::err;
        case Level::Critical: return spdlog::level::critical;
        case Level::Off: return spdlog::level::off;
    }
    return spdlog::level::info;
}

void init(const LogConfig& config) {
    auto& r = registry();
    std::lock_guard<std::mutex> lock(r.mutex);
    if (r.configured) {
        return;
    }
    r.config = config;
    g_level.store(config.level, std::memory_order_relaxed);
    build_sinks(r);
}

void init_from_env() {
    LogConfig config;

    const char* level = std::getenv("LIVEGATE_LOG_LEVEL");
    if (!level) {
        level = std::getenv("LOG_LEVEL");
    }
    if (level) {
        config.level = level_from_string(level);
    }
    if (const char* file = std::getenv("LIVEGATE_LOG_FILE")) {
        config.file_path = file;
    }

    init(config);
}

std::shared_ptr<spdlog::logger> get(const std::string& name) {
    auto& r = registry();
    std::lock_guard<std::mutex> lock(r.mutex);

    if (auto it = r.loggers.find(name); it != r.loggers.end()) {
        return it->second;
    }

    if (!r.configured) {
        build_sinks(r);
    }
    auto logger = std::make_shared<spdlog::logger>(name, r.sinks.begin(), r.sinks.end());
    logger->set_level(to_spdlog_level(g_level.load(std::memory_order_relaxed)));
    r.loggers.emplace(name, logger);
    return logger;
}

void set_level(Level level) {
    auto& r = registry();
    std::lock_guard<std::mutex> lock(r.mutex);
    r.config.level = level;
    g_level.store(level, std::memory_order_relaxed);
    for (auto& [name, logger] : r.loggers) {
        logger->set_level(to_spdlog_level(level));
    }
}

Level get_level() {
    return g_level.load(std::memory_order_relaxed);
}

bool is_level_enabled(Level level) {
    return static_cast<int>(level) >= static_cast<int>(g_level.load(std::memory_order_relaxed));
}

void shutdown() {
    auto& r = registry();
    std::lock_guard<std::mutex> lock(r.mutex);
    for (auto& [name, logger] : r.loggers) {
        logger->flush();
    }
    r.loggers.clear();
    r.sinks.clear();
    r.configured = false;
}

} // namespace livegate::log
