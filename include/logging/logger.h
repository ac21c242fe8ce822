/**
 * @file logger.h
 * @brief spdlog front end shared by the control plane and the capture path
 *
 * Capture callbacks run on the device thread and must only log through the
 * rate-limited LOG_EVERY_N / LOG_ONCE forms.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

namespace spdlog {
class logger;
}  // namespace spdlog

namespace voxcap {
namespace logging {

enum class LogLevel : std::uint8_t { Trace, Debug, Info, Warn, Error, Critical, Off };

struct LogConfig {
    LogLevel level = LogLevel::Info;
    std::string filePath;  // rotating file sink, disabled when empty
    size_t maxFileSize = static_cast<size_t>(10 * 1024 * 1024);
    size_t maxBackups = 5;
    bool consoleOutput = true;
    bool coloredOutput = true;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";
};

/**
 * Reads the "logging" object of the daemon config. Absent keys keep their
 * defaults; a key of the wrong type throws nlohmann::json::exception.
 */
LogConfig parseLogConfig(const nlohmann::json& section);

// Replaces the active sinks. Safe to call again after initializeEarly().
bool initialize(const LogConfig& config = LogConfig{});

// stderr-only logger for the window before the config file is read.
// No-op once any logger is installed.
bool initializeEarly();

bool initializeFromConfig(const std::string& configPath);

void shutdown();

void setLevel(LogLevel level);
LogLevel getLevel();
void flush();

/**
 * Writes the most recent messages, including those below the active level,
 * after a capture session ends abnormally.
 */
void dumpRecent();

std::shared_ptr<spdlog::logger> getLogger();

std::string_view levelToString(LogLevel level);

// Case-insensitive; unknown names map to Info
LogLevel stringToLevel(std::string_view str);

}  // namespace logging
}  // namespace voxcap

#include <spdlog/spdlog.h>

#define VOXCAP_LOG_AT(spdlogMacro, ...)                          \
    do {                                                         \
        if (auto voxcapLogger_ = voxcap::logging::getLogger()) { \
            spdlogMacro(voxcapLogger_, __VA_ARGS__);             \
        }                                                        \
    } while (0)

#define LOG_TRACE(...) VOXCAP_LOG_AT(SPDLOG_LOGGER_TRACE, __VA_ARGS__)
#define LOG_DEBUG(...) VOXCAP_LOG_AT(SPDLOG_LOGGER_DEBUG, __VA_ARGS__)
#define LOG_INFO(...) VOXCAP_LOG_AT(SPDLOG_LOGGER_INFO, __VA_ARGS__)
#define LOG_WARN(...) VOXCAP_LOG_AT(SPDLOG_LOGGER_WARN, __VA_ARGS__)
#define LOG_ERROR(...) VOXCAP_LOG_AT(SPDLOG_LOGGER_ERROR, __VA_ARGS__)
#define LOG_CRITICAL(...) VOXCAP_LOG_AT(SPDLOG_LOGGER_CRITICAL, __VA_ARGS__)

#define LOG_IF(level, condition, ...) \
    do {                              \
        if (condition) {              \
            LOG_##level(__VA_ARGS__); \
        }                             \
    } while (0)

// First occurrence and then every n-th, counted per call site
#define LOG_EVERY_N(level, n, ...)                                                 \
    do {                                                                           \
        static std::atomic<std::uint64_t> voxcapSiteCount_{0};                     \
        if (voxcapSiteCount_.fetch_add(1, std::memory_order_relaxed) % (n) == 0) { \
            LOG_##level(__VA_ARGS__);                                              \
        }                                                                          \
    } while (0)

#define LOG_ONCE(level, ...)                                                \
    do {                                                                    \
        static std::atomic<bool> voxcapSiteLogged_{false};                  \
        if (!voxcapSiteLogged_.exchange(true, std::memory_order_relaxed)) { \
            LOG_##level(__VA_ARGS__);                                       \
        }                                                                   \
    } while (0)
