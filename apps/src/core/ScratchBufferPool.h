#pragma once

#include <cstddef>
#include <mutex>
#include <vector>

namespace SweepLight {

/**
 * Pool of float working buffers shared by concurrent sweeps.
 *
 * acquire() hands out a buffer exclusively until the returned Lease is destroyed. The buffer is
 * resized and filled on every acquire, so nothing from a previous call survives into the next.
 * The pool must outlive every lease it hands out.
 */
class ScratchBufferPool {
public:
    class Lease {
    public:
        Lease() = default;
        ~Lease();

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&& other) noexcept;

        std::vector<float>& buffer();
        float* data() { return buffer().data(); }
        size_t size() const { return buffer_.size(); }
        bool isValid() const { return pool_ != nullptr; }

    private:
        friend class ScratchBufferPool;
        Lease(ScratchBufferPool* pool, std::vector<float>&& buffer);
        void giveBack();

        ScratchBufferPool* pool_ = nullptr;
        std::vector<float> buffer_;
    };

    explicit ScratchBufferPool(size_t maxRetained = 16);

    ScratchBufferPool(const ScratchBufferPool&) = delete;
    ScratchBufferPool& operator=(const ScratchBufferPool&) = delete;

    [[nodiscard]] Lease acquire(size_t size, float fill = 0.0f);

    size_t idleCount() const;
    size_t outstandingCount() const;

private:
    void release(std::vector<float>&& buffer);

    mutable std::mutex mutex_;
    std::vector<std::vector<float>> idle_;
    size_t maxRetained_;
    size_t outstanding_ = 0;
};

} // namespace SweepLight
