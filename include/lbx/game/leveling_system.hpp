#pragma once

/// @file leveling_system.hpp
/// @brief LevelingSystem: turns acquired items into experience and levels.

#include "lbx/ecs/component_storage.hpp"
#include "lbx/ecs/entity_manager.hpp"
#include "lbx/ecs/system_scheduler.hpp"
#include "lbx/game/loot_events.hpp"
#include "lbx/game/player_components.hpp"
#include "lbx/game/progression.hpp"

#include <string_view>

namespace lbx::game {

/// Grants experience for every ItemAcquiredEvent of the frame.
///
/// Events are aggregated per player first, so a player crossing several
/// thresholds in one frame produces a single LevelUpEvent carrying the
/// final level.
class LevelingSystem final : public lbx::ecs::ISystem {
public:
    LevelingSystem(lbx::ecs::ComponentStorage<ItemAcquiredEvent>& acquired,
                   lbx::ecs::ComponentStorage<Progression>& progressions,
                   lbx::ecs::ComponentStorage<LevelUpEvent>& levelUps,
                   const lbx::ecs::ComponentStorage<PlayerProfile>& profiles,
                   lbx::ecs::EntityManager& entities, const ExperienceCurve& curve,
                   double xpPerValue, LootFeed& feed);

    void Execute(float deltaTime) override;

    [[nodiscard]] lbx::ecs::SystemStage GetStage() const override {
        return lbx::ecs::SystemStage::PostUpdate;
    }

    [[nodiscard]] std::string_view GetName() const override { return "LevelingSystem"; }

private:
    lbx::ecs::ComponentStorage<ItemAcquiredEvent>& acquired_;
    lbx::ecs::ComponentStorage<Progression>& progressions_;
    lbx::ecs::ComponentStorage<LevelUpEvent>& levelUps_;
    const lbx::ecs::ComponentStorage<PlayerProfile>& profiles_;
    lbx::ecs::EntityManager& entities_;
    const ExperienceCurve& curve_;
    double xpPerValue_;
    LootFeed& feed_;
};

}  // namespace lbx::game
