#include "BenchmarkRunner.h"
#include "core/ConfigLoader.h"
#include "core/LightConfig.h"
#include "core/LightingPipeline.h"
#include "core/LoggingChannels.h"
#include "core/Normalizer.h"
#include "core/Scene.h"
#include "core/Timers.h"
#include <args.hxx>
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>

using namespace SweepLight;

namespace {

std::string getCommandListHelp()
{
    return "Command:\n"
           "  render <scene.json>   Light a scene and print the ASCII light map\n"
           "  bench                 Time the lighting stages on a synthetic grid";
}

std::string getExamplesHelp()
{
    return "Examples:\n"
           "  sweeplight-cli render config/scenes/cave.json\n"
           "  sweeplight-cli render scene.json --mode perceptual --log-channels sweep:trace\n"
           "  sweeplight-cli bench --size 256 --iterations 50";
}

// --config first, then the normal search paths, then built-in defaults.
std::optional<LightConfig> loadLightConfig(const std::string& explicitPath, const LightConfig& fallback)
{
    auto loaded = explicitPath.empty() ? ConfigLoader::loadOr<LightConfig>("light.json", fallback)
                                       : ConfigLoader::load<LightConfig>(explicitPath);
    if (loaded.isError()) {
        LOG_ERROR(Cli, "{}", loaded.errorValue());
        return std::nullopt;
    }
    return loaded.value();
}

int runRender(const std::string& scenePath, const std::string& configPath, const std::string& mode)
{
    auto sceneConfig = ConfigLoader::load<SceneConfig>(scenePath);
    if (sceneConfig.isError()) {
        LOG_ERROR(Cli, "{}", sceneConfig.errorValue());
        return 1;
    }

    auto scene = buildScene(sceneConfig.value());
    if (scene.isError()) {
        LOG_ERROR(
            Cli,
            "Invalid scene {}: {} ({})",
            scenePath,
            scene.errorValue().message,
            toString(scene.errorValue().code));
        return 1;
    }

    // The scene's own "light" block applies unless --config overrides it.
    std::optional<LightConfig> config = scene.value().light;
    if (!configPath.empty()) {
        config = loadLightConfig(configPath, *config);
    }
    if (!config) {
        return 1;
    }
    if (!mode.empty()) {
        const auto parsed = parseNormalizationMode(mode);
        if (!parsed) {
            LOG_ERROR(Cli, "Unknown mode '{}' (standard, brightness_limited, perceptual)", mode);
            return 1;
        }
        config->normalization_mode = *parsed;
    }

    LightingPipeline pipeline(*config);
    Timers timers;
    const Scene& s = scene.value();
    auto frame = pipeline.calculate(s.decay, s.lights, &s.walls, timers);
    if (frame.isError()) {
        LOG_ERROR(Cli, "Lighting failed: {}", frame.errorValue().message);
        return 1;
    }

    std::cout << pipeline.lightMapString(frame.value(), &s.walls);
    std::cout << "\n"
              << frame.value().lights_rendered << " light(s) rendered, "
              << frame.value().lights_skipped << " skipped, mode "
              << toString(config->normalization_mode) << "\n";
    std::cout << timers.summary();
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    args::ArgumentParser parser(
        "SweepLight CLI", "Grid light attenuation driver.\n\n" + getExamplesHelp());

    args::HelpFlag help(parser, "help", "Display this help menu", { 'h', "help" });
    args::Flag verbose(parser, "verbose", "Enable debug logging", { 'v', "verbose" });
    args::ValueFlag<std::string> logChannels(
        parser,
        "channels",
        "Per-channel log levels, e.g. 'sweep:trace,cache:debug' or '*:off'",
        { "log-channels" });
    args::ValueFlag<std::string> logConfig(
        parser, "log-config", "Logging config JSON (default: logging-config.json)", { "log-config" });
    args::ValueFlag<std::string> configFile(
        parser, "config", "Light config JSON (default: searched light.json)", { 'c', "config" });
    args::ValueFlag<std::string> mode(
        parser,
        "mode",
        "Normalization mode: standard, brightness_limited, perceptual",
        { 'm', "mode" });

    // Benchmark-specific flags.
    args::ValueFlag<int> benchSize(
        parser, "size", "Benchmark: grid width and height (default: 128)", { "size" }, 128);
    args::ValueFlag<int> benchIterations(
        parser,
        "iterations",
        "Benchmark: number of iterations (default: 20)",
        { "iterations" },
        20);

    args::Positional<std::string> command(parser, "command", getCommandListHelp());
    args::Positional<std::string> scene(parser, "scene", "Scene JSON file for 'render'");

    try {
        parser.ParseCLI(argc, argv);
    }
    catch (const args::Help&) {
        std::cout << parser;
        return 0;
    }
    catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    }

    if (logConfig) {
        if (!LoggingChannels::initializeFromConfig(args::get(logConfig), "cli")) {
            std::cerr << "Warning: logging config '" << args::get(logConfig)
                      << "' not found, using defaults\n";
        }
    }
    else {
        // Console output goes to stderr so the light map on stdout stays clean.
        LoggingChannels::initialize(spdlog::level::info, spdlog::level::off, "cli", true);
    }
    if (verbose) {
        LoggingChannels::configureFromString("*:debug");
    }
    if (logChannels) {
        LoggingChannels::configureFromString(args::get(logChannels));
    }

    if (!command) {
        std::cerr << "Error: command is required\n\n";
        std::cerr << parser;
        return 1;
    }

    const std::string commandName = args::get(command);
    const std::string modeName = mode ? args::get(mode) : "";
    const std::string configPath = configFile ? args::get(configFile) : "";

    if (commandName == "render") {
        if (!scene) {
            std::cerr << "Error: render requires a scene file\n";
            return 1;
        }
        return runRender(args::get(scene), configPath, modeName);
    }

    if (commandName == "bench") {
        auto config = loadLightConfig(configPath, getDefaultLightConfig());
        if (!config) {
            return 1;
        }
        if (!modeName.empty()) {
            const auto parsed = parseNormalizationMode(modeName);
            if (!parsed) {
                std::cerr << "Error: unknown mode '" << modeName << "'\n";
                return 1;
            }
            config->normalization_mode = *parsed;
        }

        Cli::BenchmarkRunner runner;
        const auto results =
            runner.run(args::get(benchSize), args::get(benchIterations), *config);
        std::cout << results.toJson().dump(2) << std::endl;
        return results.success ? 0 : 1;
    }

    std::cerr << "Error: unknown command '" << commandName << "'\n\n";
    std::cerr << parser;
    return 1;
}
