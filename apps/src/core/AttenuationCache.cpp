#include "AttenuationCache.h"
#include "LoggingChannels.h"
#include "SweepEngine.h"

#include <utility>

namespace SweepLight {

AttenuationKey AttenuationKey::forSource(const TransmittanceField& field, int x, int y)
{
    return AttenuationKey{
        .x = x,
        .y = y,
        .width = field.width,
        .height = field.height,
        .revision = field.revision,
        .decay_rate = field.decay_rate,
        .diagonal_mult = field.diagonal_mult,
    };
}

size_t AttenuationKeyHash::operator()(const AttenuationKey& key) const noexcept
{
    // boost::hash_combine mixing.
    size_t seed = 0;
    auto combine = [&seed](size_t value) {
        seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    };
    combine(std::hash<int>{}(key.x));
    combine(std::hash<int>{}(key.y));
    combine(std::hash<int>{}(key.width));
    combine(std::hash<int>{}(key.height));
    combine(std::hash<uint64_t>{}(key.revision));
    combine(std::hash<float>{}(key.decay_rate));
    combine(std::hash<float>{}(key.diagonal_mult));
    return seed;
}

AttenuationCache::AttenuationCache(size_t capacity) : capacity_(capacity)
{}

AttenuationCache::GridPtr AttenuationCache::find(const AttenuationKey& key)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        misses_++;
        return nullptr;
    }
    hits_++;
    return it->second;
}

AttenuationCache::GridPtr AttenuationCache::insert(const AttenuationKey& key, AttenuationGrid grid)
{
    auto ptr = std::make_shared<const AttenuationGrid>(std::move(grid));

    std::lock_guard<std::mutex> lock(mutex_);
    if (capacity_ == 0) {
        return ptr;
    }
    auto [it, inserted] = entries_.emplace(key, ptr);
    if (!inserted) {
        return it->second;
    }
    insertionOrder_.push_back(key);
    evictLocked();
    return ptr;
}

Result<AttenuationCache::GridPtr, LightingError> AttenuationCache::getOrCompute(
    const AttenuationKey& key, const Compute& compute)
{
    if (GridPtr cached = find(key)) {
        return Result<GridPtr, LightingError>::okay(std::move(cached));
    }

    auto computed = compute();
    if (computed.isError()) {
        return Result<GridPtr, LightingError>::error(computed.errorValue());
    }

    LOG_DEBUG(
        Cache,
        "Caching {}x{} attenuation for ({}, {}) at revision {}",
        key.width,
        key.height,
        key.x,
        key.y,
        key.revision);
    return Result<GridPtr, LightingError>::okay(insert(key, computed.takeValue()));
}

void AttenuationCache::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    insertionOrder_.clear();
}

void AttenuationCache::setCapacity(size_t capacity)
{
    std::lock_guard<std::mutex> lock(mutex_);
    capacity_ = capacity;
    evictLocked();
}

size_t AttenuationCache::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

size_t AttenuationCache::capacity() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return capacity_;
}

void AttenuationCache::evictLocked()
{
    while (entries_.size() > capacity_ && !insertionOrder_.empty()) {
        entries_.erase(insertionOrder_.front());
        insertionOrder_.pop_front();
    }
}

} // namespace SweepLight
