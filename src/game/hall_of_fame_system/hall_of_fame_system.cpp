/// @file hall_of_fame_system.cpp
/// @brief HallOfFameSystem implementation.

#include "lbx/game/hall_of_fame_system.hpp"

#include "lbx/foundation/game_logger.hpp"

#include <algorithm>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace lbx::game {

using foundation::LogCategory;

namespace {

struct RankedRow {
    std::size_t order;
    const PlayerProfile* profile;
    const Progression* progression;
};

} // namespace

HallOfFameSystem::HallOfFameSystem(lbx::ecs::ComponentStorage<LevelUpEvent>& levelUps,
                                   lbx::ecs::ComponentStorage<PlayerProfile>& profiles,
                                   lbx::ecs::ComponentStorage<Progression>& progressions,
                                   HallOfFame& hallOfFame)
    : levelUps_(levelUps), players_(profiles, progressions), hallOfFame_(hallOfFame) {}

void HallOfFameSystem::Execute(float /*deltaTime*/) {
    // slot id -> first event order
    std::unordered_map<uint32_t, std::size_t> pending;
    std::size_t order = 0;
    for (auto& event : levelUps_) {
        if (event.processed) {
            continue;
        }
        event.processed = true;
        pending.try_emplace(event.player.id(), order++);
    }
    if (pending.empty()) {
        return;
    }

    std::vector<RankedRow> rows;
    rows.reserve(pending.size());
    players_.ForEach([&](lbx::ecs::Entity entity, PlayerProfile& profile,
                         Progression& progression) {
        if (auto it = pending.find(entity.id()); it != pending.end()) {
            rows.push_back(RankedRow{it->second, &profile, &progression});
        }
    });

    if (rows.size() < pending.size()) {
        LBX_LOG_WARN(LogCategory::Progression,
                     std::to_string(pending.size() - rows.size()) +
                         " level-up event(s) for an unknown player");
    }

    std::sort(rows.begin(), rows.end(),
              [](const RankedRow& a, const RankedRow& b) { return a.order < b.order; });

    for (const auto& row : rows) {
        hallOfFame_.Record(row.profile->id, row.profile->name, row.progression->level,
                           row.progression->experience);
        LBX_LOG_DEBUG(LogCategory::Progression,
                      row.profile->name + " ranked #" +
                          std::to_string(hallOfFame_.RankOf(row.profile->id).value_or(0)));
    }
}

}  // namespace lbx::game
