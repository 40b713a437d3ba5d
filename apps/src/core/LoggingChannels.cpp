#include "LoggingChannels.h"
#include "ConfigLoader.h"
#include <algorithm>
#include <chrono>
#include <mutex>
#include <sstream>

namespace SweepLight {

namespace {

std::mutex& initMutex()
{
    static std::mutex mutex;
    return mutex;
}

constexpr const char* kChannelNames[] = {
    "blend", "cache", "cli", "config", "interpolate", "normalize", "pipeline", "sweep",
};

} // namespace

bool LoggingChannels::initialized_ = false;
std::vector<spdlog::sink_ptr> LoggingChannels::sharedSinks_;

void LoggingChannels::initialize(
    spdlog::level::level_enum consoleLevel,
    spdlog::level::level_enum fileLevel,
    const std::string& componentName,
    bool consoleToStderr)
{
    std::lock_guard<std::mutex> lock(initMutex());
    if (initialized_) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return;
    }

    createSinks(consoleLevel, fileLevel, componentName, "sweeplight.log", consoleToStderr);

    // Numeric stages default to warn so per-frame calls stay quiet.
    createLogger("blend", sharedSinks_, spdlog::level::warn);
    createLogger("cache", sharedSinks_, spdlog::level::warn);
    createLogger("interpolate", sharedSinks_, spdlog::level::warn);
    createLogger("normalize", sharedSinks_, spdlog::level::warn);
    createLogger("sweep", sharedSinks_, spdlog::level::warn);

    // Orchestration channels.
    createLogger("cli", sharedSinks_, spdlog::level::info);
    createLogger("config", sharedSinks_, spdlog::level::info);
    createLogger("pipeline", sharedSinks_, spdlog::level::info);

    initialized_ = true;
    SLOG_DEBUG("LoggingChannels initialized");
}

void LoggingChannels::createSinks(
    spdlog::level::level_enum consoleLevel,
    spdlog::level::level_enum fileLevel,
    const std::string& componentName,
    const std::string& filePath,
    bool consoleToStderr)
{
    spdlog::sink_ptr console_sink;
    if (consoleToStderr) {
        console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    }
    else {
        console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    }
    console_sink->set_level(consoleLevel);
    sharedSinks_ = { console_sink };

    if (fileLevel != spdlog::level::off && !filePath.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(filePath, true);
        file_sink->set_level(fileLevel);
        sharedSinks_.push_back(file_sink);
    }

    const std::string pattern = componentName == "default"
        ? "[%H:%M:%S.%e] [%n] [%^%l%$] %v"
        : "[%H:%M:%S.%e] [" + componentName + "] [%n] [%^%l%$] %v";
    for (auto& sink : sharedSinks_) {
        sink->set_pattern(pattern);
    }

    // The default logger shares the sinks but has its own name.
    const std::string loggerName = componentName.empty() ? "default" : componentName;
    auto default_logger =
        std::make_shared<spdlog::logger>(loggerName, sharedSinks_.begin(), sharedSinks_.end());
    default_logger->set_level(spdlog::level::info);
    spdlog::set_default_logger(default_logger);

    spdlog::flush_every(std::chrono::seconds(1));
}

bool LoggingChannels::initializeFromConfig(
    const std::string& filename, const std::string& componentName)
{
    auto jsonResult = ConfigLoader::loadJson(filename);
    if (jsonResult.isError()) {
        initialize(spdlog::level::info, spdlog::level::off, componentName);
        return false;
    }

    std::lock_guard<std::mutex> lock(initMutex());
    if (initialized_) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return false;
    }
    applyConfig(jsonResult.value(), componentName);
    initialized_ = true;
    return true;
}

void LoggingChannels::applyConfig(const nlohmann::json& config, const std::string& componentName)
{
    const auto consoleLevel = parseLevelString(config.value("console_level", "info"));
    const auto fileLevel = parseLevelString(config.value("file_level", "off"));
    const std::string filePath = config.value("file_path", "sweeplight.log");

    createSinks(consoleLevel, fileLevel, componentName, filePath, false);

    for (const char* name : kChannelNames) {
        createLogger(name, sharedSinks_, spdlog::level::info);
    }

    if (config.contains("channels") && config["channels"].is_object()) {
        for (const auto& [channel, level] : config["channels"].items()) {
            if (!level.is_string()) {
                spdlog::warn("Ignoring non-string level for channel '{}'", channel);
                continue;
            }
            auto logger = spdlog::get(channel);
            if (!logger) {
                spdlog::warn("Unknown logging channel '{}' in config", channel);
                continue;
            }
            logger->set_level(parseLevelString(level.get<std::string>()));
        }
    }
}

std::shared_ptr<spdlog::logger> LoggingChannels::get(LogChannel channel)
{
    // Auto-initialize with defaults if get() is called before initialize().
    // This commonly happens in unit tests that use gtest_main.
    if (!initialized_) {
        initialize();
    }

    auto logger = spdlog::get(toString(channel));
    assert(logger && "LogChannel not found after initialization");
    return logger;
}

void LoggingChannels::configureFromString(const std::string& spec)
{
    if (spec.empty()) return;

    std::stringstream ss(spec);
    std::string item;

    while (std::getline(ss, item, ',')) {
        item.erase(0, item.find_first_not_of(" \t"));
        item.erase(item.find_last_not_of(" \t") + 1);

        const size_t colonPos = item.find(':');
        if (colonPos == std::string::npos) {
            spdlog::warn("Invalid channel spec (missing colon): {}", item);
            continue;
        }

        std::string channel = item.substr(0, colonPos);
        std::string levelStr = item.substr(colonPos + 1);
        channel.erase(channel.find_last_not_of(" \t") + 1);
        levelStr.erase(0, levelStr.find_first_not_of(" \t"));

        const auto level = parseLevelString(levelStr);

        if (channel == "*") {
            spdlog::apply_all(
                [level](std::shared_ptr<spdlog::logger> logger) { logger->set_level(level); });
            spdlog::debug("Set all channels to level: {}", spdlog::level::to_string_view(level));
        }
        else {
            setChannelLevel(channel, level);
        }
    }
}

void LoggingChannels::setChannelLevel(LogChannel channel, spdlog::level::level_enum level)
{
    setChannelLevel(std::string(toString(channel)), level);
}

void LoggingChannels::setChannelLevel(const std::string& channel, spdlog::level::level_enum level)
{
    if (!initialized_) {
        initialize();
    }

    auto logger = spdlog::get(channel);
    if (!logger) {
        spdlog::warn("Unknown logging channel '{}'", channel);
        return;
    }
    logger->set_level(level);
    spdlog::debug("Set channel '{}' to level: {}", channel, spdlog::level::to_string_view(level));
}

void LoggingChannels::createLogger(
    const std::string& name,
    const std::vector<spdlog::sink_ptr>& sinks,
    spdlog::level::level_enum level)
{
    spdlog::drop(name);
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(level);
    spdlog::register_logger(logger);
}

spdlog::level::level_enum LoggingChannels::parseLevelString(const std::string& levelStr)
{
    std::string lower = levelStr;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "trace") {
        return spdlog::level::trace;
    }
    else if (lower == "debug") {
        return spdlog::level::debug;
    }
    else if (lower == "info") {
        return spdlog::level::info;
    }
    else if (lower == "warn" || lower == "warning") {
        return spdlog::level::warn;
    }
    else if (lower == "error" || lower == "err") {
        return spdlog::level::err;
    }
    else if (lower == "critical") {
        return spdlog::level::critical;
    }
    else if (lower == "off") {
        return spdlog::level::off;
    }
    else {
        spdlog::warn("Unknown log level '{}', defaulting to info", levelStr);
        return spdlog::level::info;
    }
}

} // namespace SweepLight
