/// @file leveling_system.cpp
/// @brief LevelingSystem implementation.
///
/// Two passes per frame:
///   1. Sum the experience of every pending ItemAcquiredEvent per player,
///      in first-seen order.
///   2. Apply one grant per player and emit a LevelUpEvent if the level rose.

#include "lbx/game/leveling_system.hpp"

#include "lbx/foundation/game_logger.hpp"

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace lbx::game {

using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

LevelingSystem::LevelingSystem(lbx::ecs::ComponentStorage<ItemAcquiredEvent>& acquired,
                               lbx::ecs::ComponentStorage<Progression>& progressions,
                               lbx::ecs::ComponentStorage<LevelUpEvent>& levelUps,
                               const lbx::ecs::ComponentStorage<PlayerProfile>& profiles,
                               lbx::ecs::EntityManager& entities, const ExperienceCurve& curve,
                               double xpPerValue, LootFeed& feed)
    : acquired_(acquired),
      progressions_(progressions),
      levelUps_(levelUps),
      profiles_(profiles),
      entities_(entities),
      curve_(curve),
      xpPerValue_(xpPerValue),
      feed_(feed) {}

void LevelingSystem::Execute(float /*deltaTime*/) {
    std::vector<std::pair<lbx::ecs::Entity, int64_t>> gains;
    std::unordered_map<uint32_t, std::size_t> slotOf;

    for (auto& event : acquired_) {
        if (event.processed) {
            continue;
        }
        event.processed = true;

        const int64_t xp = ExperienceForItem(event.item, xpPerValue_);
        auto [it, inserted] = slotOf.try_emplace(event.player.id(), gains.size());
        if (inserted) {
            gains.emplace_back(event.player, xp);
        } else {
            gains[it->second].second += xp;
        }
    }

    for (const auto& [player, xp] : gains) {
        const auto playerId = PlayerIdOf(profiles_, player);
        LogContext ctx;
        ctx.playerId = playerId;

        auto* progression = progressions_.Find(player);
        if (progression == nullptr) {
            LBX_LOG_CTX(LogLevel::Warning, LogCategory::Progression,
                        "Experience for a player without progression", ctx);
            continue;
        }

        auto change = GrantExperience(*progression, xp, curve_);
        if (!change) {
            LBX_LOG_CTX(LogLevel::Error, LogCategory::Progression,
                        "Experience grant failed: " + std::string(change.error().message()), ctx);
            continue;
        }
        if (!change.value().LeveledUp()) {
            continue;
        }

        const auto& levels = change.value();
        auto eventEntity = entities_.Create();
        levelUps_.Add(eventEntity, LevelUpEvent{player, levels.fromLevel, levels.toLevel});

        ctx.extra["from"] = std::to_string(levels.fromLevel);
        ctx.extra["to"] = std::to_string(levels.toLevel);
        LBX_LOG_CTX(LogLevel::Info, LogCategory::Progression, "Level up", ctx);
        feed_.Push(playerId, NotificationKind::LevelUp,
                   "Reached level " + std::to_string(levels.toLevel));
    }
}

}  // namespace lbx::game
