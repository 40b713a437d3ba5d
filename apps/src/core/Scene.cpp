#include "Scene.h"
#include "LoggingChannels.h"

#include <algorithm>
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <stdexcept>
#include <utility>

namespace SweepLight {

Result<uint32_t, std::string> parseHexColor(const std::string& text)
{
    if (text.empty() || text[0] != '#' || (text.size() != 7 && text.size() != 9)) {
        return Result<uint32_t, std::string>::error("Expected #RRGGBB or #RRGGBBAA, got '" + text + "'");
    }

    uint32_t value = 0;
    for (size_t i = 1; i < text.size(); ++i) {
        const char c = text[i];
        uint32_t digit = 0;
        if (c >= '0' && c <= '9') {
            digit = c - '0';
        }
        else if (c >= 'a' && c <= 'f') {
            digit = 10 + (c - 'a');
        }
        else if (c >= 'A' && c <= 'F') {
            digit = 10 + (c - 'A');
        }
        else {
            return Result<uint32_t, std::string>::error("Invalid hex digit in '" + text + "'");
        }
        value = (value << 4) | digit;
    }

    if (text.size() == 7) {
        value = (value << 8) | 0xFF;
    }
    return Result<uint32_t, std::string>::okay(value);
}

Result<Scene, LightingError> buildScene(const SceneConfig& config)
{
    auto shape = DecayGrid::validateShape(
        config.width,
        config.height,
        static_cast<size_t>(std::max(config.width, 0)) * static_cast<size_t>(std::max(config.height, 0)));
    if (shape.isError()) {
        return Result<Scene, LightingError>::error(shape.errorValue());
    }

    Scene scene;
    scene.decay = DecayGrid(config.width, config.height, config.base_decay);
    scene.walls = WallMask(config.width, config.height);
    scene.lights = config.lights;
    scene.light = config.light;

    auto markWall = [&scene, &config](int x, int y) {
        scene.decay.set(x, y, config.wall_decay);
        scene.walls.set(x, y, true);
    };

    for (const auto& rect : config.walls) {
        const int x0 = std::max(rect.x, 0);
        const int y0 = std::max(rect.y, 0);
        const int x1 = std::min(rect.x + rect.w, config.width);
        const int y1 = std::min(rect.y + rect.h, config.height);
        for (int y = y0; y < y1; ++y) {
            for (int x = x0; x < x1; ++x) {
                markWall(x, y);
            }
        }
    }

    const int rows = std::min(static_cast<int>(config.map.size()), config.height);
    for (int y = 0; y < rows; ++y) {
        const std::string& row = config.map[y];
        const int cols = std::min(static_cast<int>(row.size()), config.width);
        for (int x = 0; x < cols; ++x) {
            if (row[x] == '#') {
                markWall(x, y);
            }
        }
    }

    LOG_DEBUG(
        Config,
        "Built {}x{} scene with {} wall cell(s) and {} light(s)",
        config.width,
        config.height,
        scene.walls.count(),
        scene.lights.size());
    return Result<Scene, LightingError>::okay(std::move(scene));
}

void to_json(nlohmann::json& j, const WallRect& rect)
{
    j = nlohmann::json{ { "x", rect.x }, { "y", rect.y }, { "w", rect.w }, { "h", rect.h } };
}

void from_json(const nlohmann::json& j, WallRect& rect)
{
    rect.x = j.at("x").get<int>();
    rect.y = j.at("y").get<int>();
    rect.w = j.value("w", 1);
    rect.h = j.value("h", 1);
}

void to_json(nlohmann::json& j, const LightSource& light)
{
    j = nlohmann::json{
        { "x", light.position.x },
        { "y", light.position.y },
        { "color", fmt::format("#{:08X}", light.color) },
        { "intensity", light.intensity },
        { "decay_rate", light.decay_rate },
        { "static", light.is_static },
    };
}

void from_json(const nlohmann::json& j, LightSource& light)
{
    light = LightSource{};
    light.position.x = j.at("x").get<float>();
    light.position.y = j.at("y").get<float>();
    light.intensity = j.value("intensity", light.intensity);
    light.decay_rate = j.value("decay_rate", light.decay_rate);
    light.is_static = j.value("static", light.is_static);

    if (j.contains("color")) {
        const auto& color = j.at("color");
        if (color.is_string()) {
            auto parsed = parseHexColor(color.get<std::string>());
            if (parsed.isError()) {
                throw std::invalid_argument(parsed.errorValue());
            }
            light.color = parsed.value();
        }
        else {
            light.color = color.get<uint32_t>();
        }
    }
}

void to_json(nlohmann::json& j, const SceneConfig& config)
{
    j = nlohmann::json{
        { "width", config.width },
        { "height", config.height },
        { "base_decay", config.base_decay },
        { "wall_decay", config.wall_decay },
        { "walls", config.walls },
        { "map", config.map },
        { "lights", config.lights },
        { "light", config.light },
    };
}

void from_json(const nlohmann::json& j, SceneConfig& config)
{
    config = SceneConfig{};
    config.width = j.at("width").get<int>();
    config.height = j.at("height").get<int>();
    config.base_decay = j.value("base_decay", config.base_decay);
    config.wall_decay = j.value("wall_decay", config.wall_decay);
    if (j.contains("walls")) {
        config.walls = j.at("walls").get<std::vector<WallRect>>();
    }
    if (j.contains("map")) {
        config.map = j.at("map").get<std::vector<std::string>>();
    }
    if (j.contains("lights")) {
        config.lights = j.at("lights").get<std::vector<LightSource>>();
    }
    if (j.contains("light")) {
        config.light = j.at("light").get<LightConfig>();
    }
}

} // namespace SweepLight
