#include "LightManager.h"

#include <algorithm>

namespace SweepLight {

// ============================================================================
// LightManager
// ============================================================================

LightId LightManager::addLight(const LightSource& light)
{
    LightId id = next_id_++;
    lights_[id] = light;
    return id;
}

LightHandle LightManager::createLight(const LightSource& light)
{
    LightId id = addLight(light);
    return LightHandle(this, id);
}

void LightManager::removeLight(LightId id)
{
    lights_.erase(id);
}

LightSource* LightManager::getLight(LightId id)
{
    auto it = lights_.find(id);
    return it == lights_.end() ? nullptr : &it->second;
}

const LightSource* LightManager::getLight(LightId id) const
{
    auto it = lights_.find(id);
    return it == lights_.end() ? nullptr : &it->second;
}

bool LightManager::moveLight(LightId id, Vector2f position)
{
    auto it = lights_.find(id);
    if (it == lights_.end()) {
        return false;
    }
    LightSource& light = it->second;
    if (light.position == position) {
        return true;
    }
    light.position = position;
    light.is_static = false;
    return true;
}

bool LightManager::isValid(LightId id) const
{
    return lights_.contains(id);
}

size_t LightManager::count() const
{
    return lights_.size();
}

size_t LightManager::staticCount() const
{
    return static_cast<size_t>(std::count_if(lights_.begin(), lights_.end(), [](const auto& entry) {
        return entry.second.is_static;
    }));
}

void LightManager::clear()
{
    lights_.clear();
}

void LightManager::forEachLight(
    const std::function<void(LightId, const LightSource&)>& callback) const
{
    for (const auto& [id, light] : lights_) {
        callback(id, light);
    }
}

std::vector<LightSource> LightManager::snapshot() const
{
    std::vector<LightSource> lights;
    lights.reserve(lights_.size());
    for (const auto& [id, light] : lights_) {
        lights.push_back(light);
    }
    return lights;
}

// ============================================================================
// LightHandle
// ============================================================================

LightHandle::LightHandle(LightManager* manager, LightId id) : manager_(manager), id_(id)
{}

LightHandle::~LightHandle()
{
    if (manager_ != nullptr && id_ != INVALID_LIGHT_ID) {
        manager_->removeLight(id_);
    }
}

LightHandle::LightHandle(LightHandle&& other) noexcept : manager_(other.manager_), id_(other.id_)
{
    other.manager_ = nullptr;
    other.id_ = INVALID_LIGHT_ID;
}

LightHandle& LightHandle::operator=(LightHandle&& other) noexcept
{
    if (this != &other) {
        if (manager_ != nullptr && id_ != INVALID_LIGHT_ID) {
            manager_->removeLight(id_);
        }
        manager_ = other.manager_;
        id_ = other.id_;
        other.manager_ = nullptr;
        other.id_ = INVALID_LIGHT_ID;
    }
    return *this;
}

bool LightHandle::isValid() const
{
    return manager_ != nullptr && id_ != INVALID_LIGHT_ID && manager_->isValid(id_);
}

LightId LightHandle::release()
{
    LightId id = id_;
    manager_ = nullptr;
    id_ = INVALID_LIGHT_ID;
    return id;
}

} // namespace SweepLight
