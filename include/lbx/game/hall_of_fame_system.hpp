#pragma once

/// @file hall_of_fame_system.hpp
/// @brief HallOfFameSystem: records level-ups on the leaderboard.

#include "lbx/ecs/component_storage.hpp"
#include "lbx/ecs/query.hpp"
#include "lbx/ecs/system_scheduler.hpp"
#include "lbx/game/hall_of_fame.hpp"
#include "lbx/game/loot_events.hpp"
#include "lbx/game/player_components.hpp"

#include <string_view>

namespace lbx::game {

/// Updates the HallOfFame once per LevelUpEvent.  Runs after LevelingSystem.
///
/// Level-ups are matched against the profile/progression join; rows are
/// recorded in event order so same-frame ties keep their arrival order.
class HallOfFameSystem final : public lbx::ecs::ISystem {
public:
    HallOfFameSystem(lbx::ecs::ComponentStorage<LevelUpEvent>& levelUps,
                     lbx::ecs::ComponentStorage<PlayerProfile>& profiles,
                     lbx::ecs::ComponentStorage<Progression>& progressions,
                     HallOfFame& hallOfFame);

    void Execute(float deltaTime) override;

    [[nodiscard]] lbx::ecs::SystemStage GetStage() const override {
        return lbx::ecs::SystemStage::PostUpdate;
    }

    [[nodiscard]] std::string_view GetName() const override { return "HallOfFameSystem"; }

private:
    lbx::ecs::ComponentStorage<LevelUpEvent>& levelUps_;
    lbx::ecs::Query<PlayerProfile, Progression> players_;
    HallOfFame& hallOfFame_;
};

}  // namespace lbx::game
