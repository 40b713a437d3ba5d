#pragma once

// Enable all log levels for SPDLOG_LOGGER_* macros (must be before spdlog includes).
#ifndef SPDLOG_ACTIVE_LEVEL
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif

#include <cassert>
#include <memory>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace SweepLight {

/**
 * @brief Available logging channels for categorizing log messages.
 */
enum class LogChannel { Blend, Cache, Cli, Config, Interpolate, Normalize, Pipeline, Sweep };

inline const char* toString(LogChannel channel)
{
    switch (channel) {
        case LogChannel::Blend:
            return "blend";
        case LogChannel::Cache:
            return "cache";
        case LogChannel::Cli:
            return "cli";
        case LogChannel::Config:
            return "config";
        case LogChannel::Interpolate:
            return "interpolate";
        case LogChannel::Normalize:
            return "normalize";
        case LogChannel::Pipeline:
            return "pipeline";
        case LogChannel::Sweep:
            return "sweep";
    }
    assert(false && "Unhandled LogChannel in switch");
    return "";
}

/**
 * @brief Named spdlog loggers, one per subsystem, sharing console and file sinks.
 *
 * Lets a caller turn on trace output for one stage (e.g. "sweep:trace") without flooding the
 * log with the others.
 */
class LoggingChannels {
public:
    /**
     * @brief Initialize the logging system with shared sinks.
     * @param consoleLevel Default log level for console output
     * @param fileLevel Default log level for file output; spdlog::level::off disables the file
     * @param componentName Component name for the log pattern (e.g., "cli", "tests")
     * @param consoleToStderr Send console output to stderr instead of stdout
     */
    static void initialize(
        spdlog::level::level_enum consoleLevel = spdlog::level::info,
        spdlog::level::level_enum fileLevel = spdlog::level::off,
        const std::string& componentName = "default",
        bool consoleToStderr = false);

    /**
     * @brief Initialize from a JSON logging config found through ConfigLoader.
     * @return true if the config was found and applied, false if defaults were used
     */
    static bool initializeFromConfig(
        const std::string& filename = "logging-config.json",
        const std::string& componentName = "default");

    /**
     * @brief Get a specific channel logger. Initializes with defaults on first use.
     */
    static std::shared_ptr<spdlog::logger> get(LogChannel channel);

    /**
     * @brief Configure channels from a specification string.
     * @param spec Format: "channel:level,channel2:level2" or "*:level" for all
     * Examples:
     *   "sweep:trace,cache:debug" - Set sweep to trace, cache to debug
     *   "*:off,pipeline:info"     - Silence everything except the pipeline
     */
    static void configureFromString(const std::string& spec);

    static void setChannelLevel(LogChannel channel, spdlog::level::level_enum level);

    static void setChannelLevel(const std::string& channel, spdlog::level::level_enum level);

    static spdlog::level::level_enum parseLevelString(const std::string& levelStr);

    static bool isInitialized() { return initialized_; }

private:
    static void createLogger(
        const std::string& name,
        const std::vector<spdlog::sink_ptr>& sinks,
        spdlog::level::level_enum level);

    /**
     * @brief Apply configuration from a JSON object.
     *
     * Recognized keys: "console_level", "file_level", "file_path", "channels" (object of
     * channel name to level).
     */
    static void applyConfig(const nlohmann::json& config, const std::string& componentName);

    static void createSinks(
        spdlog::level::level_enum consoleLevel,
        spdlog::level::level_enum fileLevel,
        const std::string& componentName,
        const std::string& filePath,
        bool consoleToStderr);

    static bool initialized_;
    static std::vector<spdlog::sink_ptr> sharedSinks_;
};

// clang-format off
#define LOG_TRACE(channel, ...) \
    SPDLOG_LOGGER_TRACE(::SweepLight::LoggingChannels::get(::SweepLight::LogChannel::channel), __VA_ARGS__)
#define LOG_DEBUG(channel, ...) \
    SPDLOG_LOGGER_DEBUG(::SweepLight::LoggingChannels::get(::SweepLight::LogChannel::channel), __VA_ARGS__)
#define LOG_INFO(channel, ...) \
    SPDLOG_LOGGER_INFO(::SweepLight::LoggingChannels::get(::SweepLight::LogChannel::channel), __VA_ARGS__)
#define LOG_WARN(channel, ...) \
    SPDLOG_LOGGER_WARN(::SweepLight::LoggingChannels::get(::SweepLight::LogChannel::channel), __VA_ARGS__)
#define LOG_ERROR(channel, ...) \
    SPDLOG_LOGGER_ERROR(::SweepLight::LoggingChannels::get(::SweepLight::LogChannel::channel), __VA_ARGS__)

// Simple logging macros using default logger (no channel parameter, omits channel in output).
#define SLOG_TRACE(...) SPDLOG_LOGGER_TRACE(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_INFO(...) SPDLOG_LOGGER_INFO(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_WARN(...) SPDLOG_LOGGER_WARN(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_ERROR(...) SPDLOG_LOGGER_ERROR(spdlog::default_logger(), __VA_ARGS__)
// clang-format on

} // namespace SweepLight
