#pragma once

/// @file equipment_systems.hpp
/// @brief EquipSystem and SellSystem: apply equip and sell intents.

#include "lbx/ecs/component_storage.hpp"
#include "lbx/ecs/system_scheduler.hpp"
#include "lbx/game/loot_events.hpp"
#include "lbx/game/player_components.hpp"

#include <string_view>

namespace lbx::game {

/// Applies EquipRequests.  Inventory and currency are never touched.
class EquipSystem final : public lbx::ecs::ISystem {
public:
    EquipSystem(lbx::ecs::ComponentStorage<EquipRequest>& requests,
                const lbx::ecs::ComponentStorage<Inventory>& inventories,
                lbx::ecs::ComponentStorage<Equipment>& equipment,
                const lbx::ecs::ComponentStorage<PlayerProfile>& profiles, LootFeed& feed);

    void Execute(float deltaTime) override;

    [[nodiscard]] std::string_view GetName() const override { return "EquipSystem"; }

private:
    lbx::ecs::ComponentStorage<EquipRequest>& requests_;
    const lbx::ecs::ComponentStorage<Inventory>& inventories_;
    lbx::ecs::ComponentStorage<Equipment>& equipment_;
    const lbx::ecs::ComponentStorage<PlayerProfile>& profiles_;
    LootFeed& feed_;
};

/// Applies SellRequests.  Runs after EquipSystem so an item equipped and
/// sold in the same frame ends up sold and unequipped.
class SellSystem final : public lbx::ecs::ISystem {
public:
    SellSystem(lbx::ecs::ComponentStorage<SellRequest>& requests,
               lbx::ecs::ComponentStorage<Inventory>& inventories,
               lbx::ecs::ComponentStorage<Equipment>& equipment,
               lbx::ecs::ComponentStorage<Wallet>& wallets,
               const lbx::ecs::ComponentStorage<PlayerProfile>& profiles, LootFeed& feed);

    void Execute(float deltaTime) override;

    [[nodiscard]] std::string_view GetName() const override { return "SellSystem"; }

private:
    lbx::ecs::ComponentStorage<SellRequest>& requests_;
    lbx::ecs::ComponentStorage<Inventory>& inventories_;
    lbx::ecs::ComponentStorage<Equipment>& equipment_;
    lbx::ecs::ComponentStorage<Wallet>& wallets_;
    const lbx::ecs::ComponentStorage<PlayerProfile>& profiles_;
    LootFeed& feed_;
};

}  // namespace lbx::game
