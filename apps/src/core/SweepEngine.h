#pragma once

#include "DecayGrid.h"
#include "GridBuffer.h"
#include "LightingError.h"
#include "Result.h"
#include "ScratchBufferPool.h"
#include <cstdint>
#include <vector>

namespace SweepLight {

constexpr float kSqrt2 = 1.41421356237f;

struct SweepConfig {
    // Extra path length of a diagonal step relative to a cardinal one. Clamped to >= 1.
    float diagonal_mult = kSqrt2;
    // Grids with fewer cells run both passes on the calling thread.
    int parallel_min_cells = 2500;
};

/**
 * Per-cell transmittance derived from a decay grid for one decay rate.
 *
 * cardinal[i] = exp(-d), diagonal[i] = exp(-d * diagonal_mult), with
 * d = clamp(decay, 0, 1) * decay_rate. A step INTO cell i multiplies by cell i's factor.
 * Prepared once, it can be swept from any number of sources.
 */
struct TransmittanceField {
    int width = 0;
    int height = 0;
    std::vector<float> cardinal;
    std::vector<float> diagonal;
    uint64_t revision = 0;
    float decay_rate = 1.0f;
    float diagonal_mult = kSqrt2;

    bool inBounds(int x, int y) const { return x >= 0 && y >= 0 && x < width && y < height; }
};

enum class ScanOrder { RowsForward, RowsReverse, ColumnsForward, ColumnsReverse };

/**
 * Light attenuation by sweep-and-merge relaxation.
 *
 * Two passes of four directional scans each run over a copy of the grid, the second pass being
 * the point reflection of the first, and the results merge by elementwise max. Each scan lets
 * light reach a cell from the four 8-neighbours already visited in that scan. The result is
 * 1.0 at the source and falls off with the opacity integrated along the cheapest 8-connected
 * path. It is O(cells), with no rays and no queue.
 *
 * Thread-safe: calculate() and sweep() may be called concurrently. The only shared state is the
 * scratch buffer pool.
 */
class SweepEngine {
public:
    explicit SweepEngine(SweepConfig config = {});

    SweepEngine(const SweepEngine&) = delete;
    SweepEngine& operator=(const SweepEngine&) = delete;

    Result<AttenuationGrid, LightingError> calculate(
        const std::vector<float>& decay,
        int width,
        int height,
        int source_x,
        int source_y,
        float decay_rate = 1.0f) const;

    Result<AttenuationGrid, LightingError> calculate(
        const DecayGrid& grid, int source_x, int source_y, float decay_rate = 1.0f) const;

    Result<TransmittanceField, LightingError> prepare(
        const std::vector<float>& decay, int width, int height, float decay_rate = 1.0f) const;

    Result<TransmittanceField, LightingError> prepare(
        const DecayGrid& grid, float decay_rate = 1.0f) const;

    Result<AttenuationGrid, LightingError> sweep(
        const TransmittanceField& field, int source_x, int source_y) const;

    const SweepConfig& getConfig() const { return config_; }
    ScratchBufferPool& getScratchPool() const { return pool_; }

private:
    TransmittanceField buildField(
        const float* decay, int width, int height, float decay_rate, uint64_t revision) const;

    SweepConfig config_;
    mutable ScratchBufferPool pool_;
};

// Single directional scan, in place. Exposed for tests.
void runScan(ScanOrder order, const TransmittanceField& field, float* attenuation);

// Seeds the source to 1.0 and runs the four scans of one pass.
void runPass(
    const ScanOrder (&orders)[4], const TransmittanceField& field, size_t source, float* attenuation);

extern const ScanOrder kForwardPass[4];
extern const ScanOrder kReversePass[4];

} // namespace SweepLight
