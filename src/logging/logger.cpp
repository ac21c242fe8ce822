#include "logging/logger.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace voxcap {
namespace logging {

namespace {

constexpr const char* kLoggerName = "voxcap";
constexpr size_t kRecentMessages = 32;

struct LevelEntry {
    LogLevel level;
    spdlog::level::level_enum spd;
    const char* name;
    const char* alias;
};

constexpr std::array<LevelEntry, 7> kLevels = {{
    {LogLevel::Trace, spdlog::level::trace, "trace", nullptr},
    {LogLevel::Debug, spdlog::level::debug, "debug", nullptr},
    {LogLevel::Info, spdlog::level::info, "info", nullptr},
    {LogLevel::Warn, spdlog::level::warn, "warn", "warning"},
    {LogLevel::Error, spdlog::level::err, "error", "err"},
    {LogLevel::Critical, spdlog::level::critical, "critical", "fatal"},
    {LogLevel::Off, spdlog::level::off, "off", "none"},
}};

const LevelEntry& entryFor(LogLevel level) {
    for (const auto& e : kLevels) {
        if (e.level == level) {
            return e;
        }
    }
    return kLevels[2];
}

struct LoggerState {
    std::mutex mutex;
    std::shared_ptr<spdlog::logger> logger;
    std::atomic<bool> ready{false};
};

LoggerState& state() {
    static LoggerState s;
    return s;
}

std::vector<spdlog::sink_ptr> buildSinks(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    if (config.consoleOutput) {
        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        if (!config.coloredOutput) {
            console->set_color_mode(spdlog::color_mode::never);
        }
        sinks.push_back(std::move(console));
    }
    if (!config.filePath.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.filePath, config.maxFileSize, config.maxBackups));
    }
    return sinks;
}

// Caller holds state().mutex
void install(std::vector<spdlog::sink_ptr> sinks, const LogConfig& config) {
    auto& s = state();
    if (s.logger) {
        s.logger->flush();
    }
    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    logger->set_level(entryFor(config.level).spd);
    logger->set_pattern(config.pattern);
    logger->enable_backtrace(kRecentMessages);
    logger->flush_on(spdlog::level::err);
    spdlog::set_default_logger(logger);
    s.logger = std::move(logger);
    s.ready.store(true, std::memory_order_release);
}

}  // namespace

LogConfig parseLogConfig(const nlohmann::json& section) {
    LogConfig config;
    if (!section.is_object()) {
        return config;
    }
    if (section.contains("level")) {
        config.level = stringToLevel(section.at("level").get<std::string>());
    }
    config.filePath = section.value("filePath", config.filePath);
    config.maxFileSize = section.value("maxFileSize", config.maxFileSize);
    config.maxBackups = section.value("maxBackups", config.maxBackups);
    config.consoleOutput = section.value("consoleOutput", config.consoleOutput);
    config.coloredOutput = section.value("coloredOutput", config.coloredOutput);
    config.pattern = section.value("pattern", config.pattern);
    return config;
}

bool initialize(const LogConfig& config) {
    {
        std::lock_guard<std::mutex> lock(state().mutex);
        try {
            install(buildSinks(config), config);
        } catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "voxcap: logger setup failed: " << ex.what() << std::endl;
            return false;
        }
    }

    LOG_INFO("Logging at level {}", levelToString(config.level));
    LOG_IF(INFO, !config.filePath.empty(), "Log file {} ({} MB, {} backups)", config.filePath,
           config.maxFileSize / (1024 * 1024), config.maxBackups);
    return true;
}

bool initializeEarly() {
    std::lock_guard<std::mutex> lock(state().mutex);
    if (state().ready.load(std::memory_order_acquire)) {
        return true;
    }
    try {
        install({std::make_shared<spdlog::sinks::stderr_color_sink_mt>()}, LogConfig{});
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "voxcap: early logger setup failed: " << ex.what() << std::endl;
        return false;
    }
    return true;
}

bool initializeFromConfig(const std::string& configPath) {
    LogConfig config;
    std::ifstream file(configPath);
    if (file.is_open()) {
        try {
            auto json = nlohmann::json::parse(file);
            if (json.contains("logging")) {
                config = parseLogConfig(json["logging"]);
            }
        } catch (const nlohmann::json::exception& ex) {
            std::cerr << "voxcap: ignoring logging section of " << configPath << ": "
                      << ex.what() << std::endl;
            config = LogConfig{};
        }
    }
    return initialize(config);
}

void shutdown() {
    std::lock_guard<std::mutex> lock(state().mutex);
    auto& s = state();
    if (s.logger) {
        s.logger->info("Logging shut down");
        s.logger->flush();
    }
    s.ready.store(false, std::memory_order_release);
    spdlog::shutdown();
    s.logger.reset();
}

void setLevel(LogLevel level) {
    auto logger = getLogger();
    if (!logger) {
        return;
    }
    logger->set_level(entryFor(level).spd);
    LOG_INFO("Log level set to {}", levelToString(level));
}

LogLevel getLevel() {
    auto logger = getLogger();
    if (!logger) {
        return LogLevel::Info;
    }
    auto current = logger->level();
    auto it = std::find_if(kLevels.begin(), kLevels.end(),
                           [current](const LevelEntry& e) { return e.spd == current; });
    return it != kLevels.end() ? it->level : LogLevel::Info;
}

void flush() {
    if (auto logger = getLogger()) {
        logger->flush();
    }
}

void dumpRecent() {
    if (auto logger = getLogger()) {
        logger->dump_backtrace();
        logger->flush();
    }
}

std::shared_ptr<spdlog::logger> getLogger() {
    auto& s = state();
    if (!s.ready.load(std::memory_order_acquire)) {
        initializeEarly();
    }
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.logger;
}

std::string_view levelToString(LogLevel level) {
    return entryFor(level).name;
}

LogLevel stringToLevel(std::string_view str) {
    std::string lower(str);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const auto& e : kLevels) {
        if (lower == e.name || (e.alias && lower == e.alias)) {
            return e.level;
        }
    }
    return LogLevel::Info;
}

}  // namespace logging
}  // namespace voxcap
