#pragma once

/// @file box_opening_system.hpp
/// @brief BoxOpeningSystem: opens chosen boxes into player inventories.

#include "lbx/ecs/component_storage.hpp"
#include "lbx/ecs/entity_manager.hpp"
#include "lbx/ecs/system_scheduler.hpp"
#include "lbx/game/loot_events.hpp"
#include "lbx/game/loot_pool.hpp"
#include "lbx/game/player_components.hpp"
#include "lbx/game/random_source.hpp"

#include <string_view>

namespace lbx::game {

/// Opens the box of every chosen, unprocessed OpenBoxRequest.
///
/// Each successful open adds the item to the player's Inventory and spawns
/// an ItemAcquiredEvent entity for LevelingSystem.
class BoxOpeningSystem final : public lbx::ecs::ISystem {
public:
    BoxOpeningSystem(lbx::ecs::ComponentStorage<OpenBoxRequest>& requests,
                     lbx::ecs::ComponentStorage<Inventory>& inventories,
                     const lbx::ecs::ComponentStorage<PlayerProfile>& profiles,
                     lbx::ecs::ComponentStorage<ItemAcquiredEvent>& acquired,
                     lbx::ecs::EntityManager& entities, LootBoxPool& pool, RandomSource& rng,
                     LootFeed& feed);

    void Execute(float deltaTime) override;

    [[nodiscard]] std::string_view GetName() const override { return "BoxOpeningSystem"; }

private:
    lbx::ecs::ComponentStorage<OpenBoxRequest>& requests_;
    lbx::ecs::ComponentStorage<Inventory>& inventories_;
    const lbx::ecs::ComponentStorage<PlayerProfile>& profiles_;
    lbx::ecs::ComponentStorage<ItemAcquiredEvent>& acquired_;
    lbx::ecs::EntityManager& entities_;
    LootBoxPool& pool_;
    RandomSource& rng_;
    LootFeed& feed_;
};

}  // namespace lbx::game
