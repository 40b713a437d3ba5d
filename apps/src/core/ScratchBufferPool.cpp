#include "ScratchBufferPool.h"
#include "Assert.h"
#include <algorithm>
#include <utility>

namespace SweepLight {

// ============================================================================
// ScratchBufferPool
// ============================================================================

ScratchBufferPool::ScratchBufferPool(size_t maxRetained) : maxRetained_(maxRetained)
{}

ScratchBufferPool::Lease ScratchBufferPool::acquire(size_t size, float fill)
{
    std::vector<float> buffer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!idle_.empty()) {
            // Prefer the most recently returned buffer; it is the one most likely warm in cache.
            buffer = std::move(idle_.back());
            idle_.pop_back();
        }
        ++outstanding_;
    }

    buffer.assign(size, fill);
    return Lease(this, std::move(buffer));
}

void ScratchBufferPool::release(std::vector<float>&& buffer)
{
    std::lock_guard<std::mutex> lock(mutex_);
    SWEEPLIGHT_ASSERT(outstanding_ > 0, "ScratchBufferPool released more buffers than acquired");
    --outstanding_;
    if (idle_.size() < maxRetained_) {
        idle_.push_back(std::move(buffer));
    }
}

size_t ScratchBufferPool::idleCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return idle_.size();
}

size_t ScratchBufferPool::outstandingCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return outstanding_;
}

// ============================================================================
// Lease
// ============================================================================

ScratchBufferPool::Lease::Lease(ScratchBufferPool* pool, std::vector<float>&& buffer)
    : pool_(pool), buffer_(std::move(buffer))
{}

ScratchBufferPool::Lease::~Lease()
{
    giveBack();
}

ScratchBufferPool::Lease::Lease(Lease&& other) noexcept
    : pool_(other.pool_), buffer_(std::move(other.buffer_))
{
    other.pool_ = nullptr;
}

ScratchBufferPool::Lease& ScratchBufferPool::Lease::operator=(Lease&& other) noexcept
{
    if (this != &other) {
        giveBack();
        pool_ = other.pool_;
        buffer_ = std::move(other.buffer_);
        other.pool_ = nullptr;
    }
    return *this;
}

std::vector<float>& ScratchBufferPool::Lease::buffer()
{
    SWEEPLIGHT_ASSERT(pool_ != nullptr, "Scratch lease used after release");
    return buffer_;
}

void ScratchBufferPool::Lease::giveBack()
{
    if (pool_ != nullptr) {
        pool_->release(std::move(buffer_));
        pool_ = nullptr;
        buffer_ = {};
    }
}

} // namespace SweepLight
