#pragma once

#include "DecayGrid.h"
#include "LightConfig.h"
#include "LightTypes.h"
#include "LightingError.h"
#include "Result.h"
#include "WallMask.h"
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <vector>

namespace SweepLight {

struct WallRect {
    int x = 0;
    int y = 0;
    int w = 1;
    int h = 1;
};

/**
 * Scene description as loaded from JSON.
 *
 * Walls come from rectangles and/or an ASCII "map" (one string per row, '#' marks a wall).
 * Wall cells take wall_decay and are flagged in the WallMask; every other cell takes base_decay.
 * Light colors are packed integers or "#RRGGBB" / "#RRGGBBAA" strings.
 */
struct SceneConfig {
    int width = 0;
    int height = 0;
    float base_decay = 0.1f;
    float wall_decay = 0.6f;
    std::vector<WallRect> walls;
    std::vector<std::string> map;
    std::vector<LightSource> lights;
    LightConfig light = getDefaultLightConfig();
};

struct Scene {
    DecayGrid decay;
    WallMask walls;
    std::vector<LightSource> lights;
    LightConfig light;
};

// Rectangles are clipped to the grid. Map rows longer than the grid are truncated.
Result<Scene, LightingError> buildScene(const SceneConfig& config);

// Parses "#RRGGBB" (opaque) or "#RRGGBBAA".
Result<uint32_t, std::string> parseHexColor(const std::string& text);

void to_json(nlohmann::json& j, const WallRect& rect);
void from_json(const nlohmann::json& j, WallRect& rect);
void to_json(nlohmann::json& j, const LightSource& light);
void from_json(const nlohmann::json& j, LightSource& light);
void to_json(nlohmann::json& j, const SceneConfig& config);
void from_json(const nlohmann::json& j, SceneConfig& config);

} // namespace SweepLight
