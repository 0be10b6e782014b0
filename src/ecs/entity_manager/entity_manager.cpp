/// @file entity_manager.cpp
/// @brief Entity lifecycle management implementation.

#include "lbx/ecs/entity_manager.hpp"

#include <algorithm>
#include <cassert>

namespace lbx::ecs {

Entity EntityManager::Create() {
    uint32_t index = 0;

    if (!freeList_.empty()) {
        index = freeList_.front();
        freeList_.pop_front();
        alive_[index] = true;
    } else {
        index = static_cast<uint32_t>(versions_.size());
        assert(index <= Entity::kMaxId && "Entity index space exhausted");
        versions_.push_back(0);
        alive_.push_back(true);
    }

    ++count_;
    return Entity(index, versions_[index]);
}

void EntityManager::Destroy(Entity entity) {
    if (IsAlive(entity)) {
        destroyInternal(entity);
    }
}

void EntityManager::DestroyDeferred(Entity entity) {
    if (!IsAlive(entity)) {
        return;
    }
    // Queueing the same handle twice must not destroy a recycled slot later.
    if (std::find(pendingDestroy_.begin(), pendingDestroy_.end(), entity) != pendingDestroy_.end()) {
        return;
    }
    pendingDestroy_.push_back(entity);
}

void EntityManager::FlushDeferred() {
    auto pending = std::move(pendingDestroy_);
    pendingDestroy_.clear();

    for (const auto& entity : pending) {
        if (IsAlive(entity)) {
            destroyInternal(entity);
        }
    }
}

bool EntityManager::IsAlive(Entity entity) const noexcept {
    if (!entity.isValid()) {
        return false;
    }
    const auto idx = entity.id();
    return idx < versions_.size() && alive_[idx] && versions_[idx] == entity.version();
}

Entity EntityManager::HandleOf(uint32_t id) const noexcept {
    if (id >= versions_.size() || !alive_[id]) {
        return Entity::invalid();
    }
    return Entity(id, versions_[id]);
}

void EntityManager::RegisterStorage(IComponentStorage* storage) {
    assert(storage != nullptr && "Cannot register null storage");
    if (std::find(storages_.begin(), storages_.end(), storage) == storages_.end()) {
        storages_.push_back(storage);
    }
}

void EntityManager::destroyInternal(Entity entity) {
    const auto idx = entity.id();

    for (auto* storage : storages_) {
        storage->Remove(entity);
    }

    alive_[idx] = false;
    // Wraps 255 -> 0; the sentinel is unreachable because kMaxId < kIdMask.
    versions_[idx] = static_cast<uint8_t>(versions_[idx] + 1);
    freeList_.push_back(idx);
    --count_;
}

} // namespace lbx::ecs
