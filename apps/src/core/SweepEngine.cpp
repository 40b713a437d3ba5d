#include "SweepEngine.h"
#include "ColorNames.h"
#include "LoggingChannels.h"

#include <algorithm>
#include <cmath>
#include <spdlog/fmt/fmt.h>
#include <utility>

namespace SweepLight {

const ScanOrder kForwardPass[4] = {
    ScanOrder::RowsForward,
    ScanOrder::RowsReverse,
    ScanOrder::ColumnsForward,
    ScanOrder::ColumnsReverse,
};

// Point reflection of kForwardPass, scan for scan.
const ScanOrder kReversePass[4] = {
    ScanOrder::RowsReverse,
    ScanOrder::RowsForward,
    ScanOrder::ColumnsReverse,
    ScanOrder::ColumnsForward,
};

namespace {

constexpr float kMaxDecayRate = 1000.0f;
constexpr float kMaxDiagonalMult = 8.0f;

float sanitizeDecayRate(float rate)
{
    return rate > 0.0f ? std::min(rate, kMaxDecayRate) : 0.0f;
}

float sanitizeDiagonalMult(float mult)
{
    // NaN lands on 1 as well.
    if (!(mult >= 1.0f)) {
        return 1.0f;
    }
    return std::min(mult, kMaxDiagonalMult);
}

// Each scan relaxes a cell from the four 8-neighbours that precede it in traversal order.
// A candidate is (neighbour attenuation) x (transmittance of the cell being entered).

void scanRowsForward(const TransmittanceField& field, float* att)
{
    const int w = field.width;
    const int h = field.height;
    const float* tc = field.cardinal.data();
    const float* td = field.diagonal.data();

    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            const size_t i = static_cast<size_t>(y) * w + x;
            float best = att[i];
            if (x > 0) {
                best = std::max(best, att[i - 1] * tc[i]);
            }
            if (y > 0) {
                const size_t up = i - w;
                best = std::max(best, att[up] * tc[i]);
                if (x > 0) {
                    best = std::max(best, att[up - 1] * td[i]);
                }
                if (x + 1 < w) {
                    best = std::max(best, att[up + 1] * td[i]);
                }
            }
            att[i] = best;
        }
    }
}

void scanRowsReverse(const TransmittanceField& field, float* att)
{
    const int w = field.width;
    const int h = field.height;
    const float* tc = field.cardinal.data();
    const float* td = field.diagonal.data();

    for (int y = h - 1; y >= 0; --y) {
        for (int x = w - 1; x >= 0; --x) {
            const size_t i = static_cast<size_t>(y) * w + x;
            float best = att[i];
            if (x + 1 < w) {
                best = std::max(best, att[i + 1] * tc[i]);
            }
            if (y + 1 < h) {
                const size_t down = i + w;
                best = std::max(best, att[down] * tc[i]);
                if (x + 1 < w) {
                    best = std::max(best, att[down + 1] * td[i]);
                }
                if (x > 0) {
                    best = std::max(best, att[down - 1] * td[i]);
                }
            }
            att[i] = best;
        }
    }
}

void scanColumnsForward(const TransmittanceField& field, float* att)
{
    const int w = field.width;
    const int h = field.height;
    const float* tc = field.cardinal.data();
    const float* td = field.diagonal.data();

    for (int x = 0; x < w; ++x) {
        for (int y = 0; y < h; ++y) {
            const size_t i = static_cast<size_t>(y) * w + x;
            float best = att[i];
            if (y > 0) {
                best = std::max(best, att[i - w] * tc[i]);
            }
            if (x > 0) {
                const size_t left = i - 1;
                best = std::max(best, att[left] * tc[i]);
                if (y > 0) {
                    best = std::max(best, att[left - w] * td[i]);
                }
                if (y + 1 < h) {
                    best = std::max(best, att[left + w] * td[i]);
                }
            }
            att[i] = best;
        }
    }
}

void scanColumnsReverse(const TransmittanceField& field, float* att)
{
    const int w = field.width;
    const int h = field.height;
    const float* tc = field.cardinal.data();
    const float* td = field.diagonal.data();

    for (int x = w - 1; x >= 0; --x) {
        for (int y = h - 1; y >= 0; --y) {
            const size_t i = static_cast<size_t>(y) * w + x;
            float best = att[i];
            if (y + 1 < h) {
                best = std::max(best, att[i + w] * tc[i]);
            }
            if (x + 1 < w) {
                const size_t right = i + 1;
                best = std::max(best, att[right] * tc[i]);
                if (y + 1 < h) {
                    best = std::max(best, att[right + w] * td[i]);
                }
                if (y > 0) {
                    best = std::max(best, att[right - w] * td[i]);
                }
            }
            att[i] = best;
        }
    }
}

} // namespace

void runScan(ScanOrder order, const TransmittanceField& field, float* attenuation)
{
    switch (order) {
        case ScanOrder::RowsForward:
            scanRowsForward(field, attenuation);
            return;
        case ScanOrder::RowsReverse:
            scanRowsReverse(field, attenuation);
            return;
        case ScanOrder::ColumnsForward:
            scanColumnsForward(field, attenuation);
            return;
        case ScanOrder::ColumnsReverse:
            scanColumnsReverse(field, attenuation);
            return;
    }
}

void runPass(
    const ScanOrder (&orders)[4], const TransmittanceField& field, size_t source, float* attenuation)
{
    for (ScanOrder order : orders) {
        attenuation[source] = 1.0f;
        runScan(order, field, attenuation);
    }
}

// ============================================================================
// SweepEngine
// ============================================================================

SweepEngine::SweepEngine(SweepConfig config) : config_(config)
{
    config_.diagonal_mult = sanitizeDiagonalMult(config_.diagonal_mult);
    config_.parallel_min_cells = std::max(config_.parallel_min_cells, 0);
}

Result<AttenuationGrid, LightingError> SweepEngine::calculate(
    const std::vector<float>& decay,
    int width,
    int height,
    int source_x,
    int source_y,
    float decay_rate) const
{
    auto field = prepare(decay, width, height, decay_rate);
    if (field.isError()) {
        return Result<AttenuationGrid, LightingError>::error(field.errorValue());
    }
    return sweep(field.value(), source_x, source_y);
}

Result<AttenuationGrid, LightingError> SweepEngine::calculate(
    const DecayGrid& grid, int source_x, int source_y, float decay_rate) const
{
    auto field = prepare(grid, decay_rate);
    if (field.isError()) {
        return Result<AttenuationGrid, LightingError>::error(field.errorValue());
    }
    return sweep(field.value(), source_x, source_y);
}

Result<TransmittanceField, LightingError> SweepEngine::prepare(
    const std::vector<float>& decay, int width, int height, float decay_rate) const
{
    auto shape = DecayGrid::validateShape(width, height, decay.size());
    if (shape.isError()) {
        return Result<TransmittanceField, LightingError>::error(shape.errorValue());
    }
    return Result<TransmittanceField, LightingError>::okay(
        buildField(decay.data(), width, height, decay_rate, DecayGrid::nextRevision()));
}

Result<TransmittanceField, LightingError> SweepEngine::prepare(
    const DecayGrid& grid, float decay_rate) const
{
    auto shape = DecayGrid::validateShape(grid.width(), grid.height(), grid.size());
    if (shape.isError()) {
        return Result<TransmittanceField, LightingError>::error(shape.errorValue());
    }
    return Result<TransmittanceField, LightingError>::okay(
        buildField(grid.data(), grid.width(), grid.height(), decay_rate, grid.revision()));
}

TransmittanceField SweepEngine::buildField(
    const float* decay, int width, int height, float decay_rate, uint64_t revision) const
{
    TransmittanceField field;
    field.width = width;
    field.height = height;
    field.revision = revision;
    field.decay_rate = sanitizeDecayRate(decay_rate);
    field.diagonal_mult = config_.diagonal_mult;

    const size_t count = static_cast<size_t>(width) * static_cast<size_t>(height);
    field.cardinal.resize(count);
    field.diagonal.resize(count);

    const float rate = field.decay_rate;
    const float diag = field.diagonal_mult;
    float* cardinal = field.cardinal.data();
    float* diagonal = field.diagonal.data();

#pragma omp parallel for schedule(static) \
    if (count >= static_cast<size_t>(config_.parallel_min_cells))
    for (size_t i = 0; i < count; ++i) {
        const float d = ColorNames::clampUnit(decay[i]) * rate;
        cardinal[i] = std::exp(-d);
        diagonal[i] = std::exp(-d * diag);
    }

    return field;
}

Result<AttenuationGrid, LightingError> SweepEngine::sweep(
    const TransmittanceField& field, int source_x, int source_y) const
{
    if (field.width <= 0 || field.height <= 0 || field.cardinal.size() != field.diagonal.size()
        || field.cardinal.size()
            != static_cast<size_t>(field.width) * static_cast<size_t>(field.height)) {
        return Result<AttenuationGrid, LightingError>::error(LightingError::invalidDimensions(
            fmt::format("Transmittance field {}x{} is empty or malformed", field.width, field.height)));
    }
    if (!field.inBounds(source_x, source_y)) {
        return Result<AttenuationGrid, LightingError>::error(LightingError::outOfBounds(fmt::format(
            "Source ({}, {}) outside {}x{} grid", source_x, source_y, field.width, field.height)));
    }

    LOG_TRACE(
        Sweep,
        "Sweeping {}x{} from ({}, {}), decay rate {}",
        field.width,
        field.height,
        source_x,
        source_y,
        field.decay_rate);

    const size_t count = field.cardinal.size();
    const size_t source = static_cast<size_t>(source_y) * field.width + source_x;

    AttenuationGrid forward(field.width, field.height, 0.0f);
    ScratchBufferPool::Lease reverse = pool_.acquire(count, 0.0f);
    float* forwardData = forward.begin();
    float* reverseData = reverse.data();

    // The two passes share nothing but the read-only field.
#pragma omp parallel sections if (count >= static_cast<size_t>(config_.parallel_min_cells))
    {
#pragma omp section
        runPass(kForwardPass, field, source, forwardData);
#pragma omp section
        runPass(kReversePass, field, source, reverseData);
    }

#pragma omp parallel for schedule(static) \
    if (count >= static_cast<size_t>(config_.parallel_min_cells))
    for (size_t i = 0; i < count; ++i) {
        forwardData[i] = std::max(forwardData[i], reverseData[i]);
    }

    return Result<AttenuationGrid, LightingError>::okay(std::move(forward));
}

} // namespace SweepLight
