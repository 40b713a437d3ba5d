#pragma once

#include "GridBuffer.h"
#include "LightingError.h"
#include "Result.h"
#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace SweepLight {

struct TransmittanceField;

struct AttenuationKey {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;
    uint64_t revision = 0;
    float decay_rate = 1.0f;
    float diagonal_mult = 1.0f;

    bool operator==(const AttenuationKey& other) const = default;

    static AttenuationKey forSource(const TransmittanceField& field, int x, int y);
};

struct AttenuationKeyHash {
    size_t operator()(const AttenuationKey& key) const noexcept;
};

/**
 * Lattice-aligned attenuation grids of static lights, shared between frames.
 *
 * The grid revision is part of the key, so a geometry change makes every older entry
 * unreachable; those entries age out through oldest-first eviction. Grids are handed out as
 * shared immutable pointers and stay valid after eviction or clear().
 *
 * Thread-safe. Two threads missing on the same key may both compute it; the first insert wins.
 */
class AttenuationCache {
public:
    using GridPtr = std::shared_ptr<const AttenuationGrid>;
    using Compute = std::function<Result<AttenuationGrid, LightingError>()>;

    explicit AttenuationCache(size_t capacity = 256);

    AttenuationCache(const AttenuationCache&) = delete;
    AttenuationCache& operator=(const AttenuationCache&) = delete;

    GridPtr find(const AttenuationKey& key);
    GridPtr insert(const AttenuationKey& key, AttenuationGrid grid);
    Result<GridPtr, LightingError> getOrCompute(const AttenuationKey& key, const Compute& compute);

    void clear();
    void setCapacity(size_t capacity);

    size_t size() const;
    size_t capacity() const;
    uint64_t hits() const { return hits_.load(); }
    uint64_t misses() const { return misses_.load(); }

private:
    void evictLocked();

    mutable std::mutex mutex_;
    std::unordered_map<AttenuationKey, GridPtr, AttenuationKeyHash> entries_;
    std::deque<AttenuationKey> insertionOrder_;
    size_t capacity_;
    std::atomic<uint64_t> hits_{ 0 };
    std::atomic<uint64_t> misses_{ 0 };
};

} // namespace SweepLight
