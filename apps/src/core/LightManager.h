#pragma once

#include "Assert.h"
#include "LightTypes.h"
#include "StrongType.h"
#include <functional>
#include <map>
#include <vector>

namespace SweepLight {

using LightId = StrongType<struct LightIdTag>;
constexpr LightId INVALID_LIGHT_ID{};

class LightHandle;

/**
 * Registry of light sources with handle-based access and optional RAII cleanup.
 *
 * Provides two modes of operation:
 * 1. Manual mode: addLight() returns LightId for caller-managed lifecycle.
 * 2. RAII mode: createLight() returns LightHandle that auto-removes on destruction.
 *
 * Iteration is in ascending id order, so a frame built from the registry is reproducible.
 */
class LightManager {
public:
    LightManager() = default;
    ~LightManager() = default;

    LightManager(const LightManager&) = delete;
    LightManager& operator=(const LightManager&) = delete;
    LightManager(LightManager&&) = default;
    LightManager& operator=(LightManager&&) = default;

    LightId addLight(const LightSource& light);
    [[nodiscard]] LightHandle createLight(const LightSource& light);
    void removeLight(LightId id);

    LightSource* getLight(LightId id);
    const LightSource* getLight(LightId id) const;

    // Repositions a light. Returns false for an unknown id. A moved static light becomes
    // dynamic, since its cached attenuation no longer applies.
    bool moveLight(LightId id, Vector2f position);

    bool isValid(LightId id) const;
    size_t count() const;
    size_t staticCount() const;
    void clear();

    void forEachLight(const std::function<void(LightId, const LightSource&)>& callback) const;

    // All lights in ascending id order, as consumed by LightingPipeline.
    std::vector<LightSource> snapshot() const;

private:
    friend class LightHandle;

    std::map<LightId, LightSource> lights_;
    LightId next_id_{ 1 };
};

/**
 * RAII handle that automatically removes a light when destroyed.
 *
 * Move-only to prevent double-removal. Use release() to transfer
 * ownership to manual management.
 */
class LightHandle {
public:
    LightHandle() = default;
    ~LightHandle();

    LightHandle(const LightHandle&) = delete;
    LightHandle& operator=(const LightHandle&) = delete;
    LightHandle(LightHandle&& other) noexcept;
    LightHandle& operator=(LightHandle&& other) noexcept;

    LightId id() const { return id_; }
    bool isValid() const;
    LightId release();

    LightSource* get()
    {
        SWEEPLIGHT_ASSERT(manager_ != nullptr && id_ != INVALID_LIGHT_ID, "Invalid LightHandle");
        return manager_->getLight(id_);
    }

    const LightSource* get() const
    {
        SWEEPLIGHT_ASSERT(manager_ != nullptr && id_ != INVALID_LIGHT_ID, "Invalid LightHandle");
        return manager_->getLight(id_);
    }

private:
    friend class LightManager;
    LightHandle(LightManager* manager, LightId id);

    LightManager* manager_ = nullptr;
    LightId id_ = INVALID_LIGHT_ID;
};

} // namespace SweepLight
