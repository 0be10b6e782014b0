#pragma once

/// @file entity_manager.hpp
/// @brief Entity lifecycle: creation, versioned recycling, deferred destruction.

#include "lbx/ecs/component_storage.hpp"
#include "lbx/ecs/entity.hpp"

#include <cstdint>
#include <deque>
#include <vector>

namespace lbx::ecs {

/// Owns the canonical set of live entities.
///
/// A destroyed slot goes to the back of a FIFO free list with its
/// generation bumped, so handles to the old occupant stop being alive.
/// Storages registered with RegisterStorage() lose their component for
/// an entity the moment it is destroyed.
///
/// Players live for the whole session; request and event entities are
/// short-lived and are normally destroyed in bulk at the end of a frame
/// through DestroyDeferred() + FlushDeferred().
class EntityManager {
public:
    EntityManager() = default;

    EntityManager(const EntityManager&) = delete;
    EntityManager& operator=(const EntityManager&) = delete;
    EntityManager(EntityManager&&) noexcept = default;
    EntityManager& operator=(EntityManager&&) noexcept = default;

    /// Create a new entity, recycling the oldest free slot if any.
    [[nodiscard]] Entity Create();

    /// Destroy @p entity and drop its components.  No-op if not alive.
    void Destroy(Entity entity);

    /// Queue @p entity for destruction at the next FlushDeferred().
    void DestroyDeferred(Entity entity);

    /// Destroy all queued entities that are still alive.
    void FlushDeferred();

    [[nodiscard]] bool IsAlive(Entity entity) const noexcept;

    /// Live handle for slot @p id, or Entity::invalid() if the slot is free.
    ///
    /// Storages and queries only know slot ids; this restores the full
    /// handle including the current generation.
    [[nodiscard]] Entity HandleOf(uint32_t id) const noexcept;

    [[nodiscard]] std::size_t Count() const noexcept { return count_; }

    /// Number of slots ever allocated, live or free.
    [[nodiscard]] std::size_t Capacity() const noexcept { return versions_.size(); }

    [[nodiscard]] std::size_t PendingCount() const noexcept { return pendingDestroy_.size(); }

    /// Register a storage for automatic cleanup.  The manager does not own it.
    void RegisterStorage(IComponentStorage* storage);

private:
    void destroyInternal(Entity entity);

    std::vector<uint8_t> versions_;
    std::vector<bool> alive_;
    std::deque<uint32_t> freeList_;
    std::vector<Entity> pendingDestroy_;
    std::vector<IComponentStorage*> storages_;
    std::size_t count_ = 0;
};

}  // namespace lbx::ecs
