#pragma once

/// @file box_choice_system.hpp
/// @brief BoxChoiceSystem: resolves open requests to concrete boxes.

#include "lbx/ecs/component_storage.hpp"
#include "lbx/ecs/system_scheduler.hpp"
#include "lbx/game/loot_events.hpp"
#include "lbx/game/loot_pool.hpp"
#include "lbx/game/player_components.hpp"

#include <string_view>

namespace lbx::game {

/// Fills OpenBoxRequest::chosen from the request's BoxSelection.
///
/// Two AutoFirst requests in the same frame never claim the same box: the
/// second one gets the next lowest unclaimed id.  A request that cannot be
/// resolved is marked processed and reported as ActionFailed.
class BoxChoiceSystem final : public lbx::ecs::ISystem {
public:
    BoxChoiceSystem(lbx::ecs::ComponentStorage<OpenBoxRequest>& requests,
                    const LootBoxPool& pool,
                    const lbx::ecs::ComponentStorage<PlayerProfile>& profiles, LootFeed& feed);

    void Execute(float deltaTime) override;

    [[nodiscard]] std::string_view GetName() const override { return "BoxChoiceSystem"; }

private:
    lbx::ecs::ComponentStorage<OpenBoxRequest>& requests_;
    const LootBoxPool& pool_;
    const lbx::ecs::ComponentStorage<PlayerProfile>& profiles_;
    LootFeed& feed_;
};

}  // namespace lbx::game
