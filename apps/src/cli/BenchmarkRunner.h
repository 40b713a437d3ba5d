#pragma once

#include "core/LightConfig.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace SweepLight {
namespace Cli {

struct BenchmarkStage {
    std::string name;
    unsigned calls = 0;
    double total_ms = 0.0;
    double avg_ms = 0.0;
};

struct BenchmarkResults {
    int size = 0;
    int iterations = 0;
    bool success = false;
    std::string error;
    std::vector<BenchmarkStage> stages;

    nlohmann::json toJson() const;
};

/**
 * Times the lighting stages on a size x size grid with a scattered wall pattern.
 *
 * Per iteration: one integral-position sweep, one four-corner subpixel calculation, and one
 * full pipeline frame with a moving dynamic light and a static light.
 */
class BenchmarkRunner {
public:
    BenchmarkResults run(int size, int iterations, const LightConfig& config);
};

} // namespace Cli
} // namespace SweepLight
