/// @file box_opening_system.cpp
/// @brief BoxOpeningSystem implementation.

#include "lbx/game/box_opening_system.hpp"

#include "lbx/foundation/game_logger.hpp"
#include "lbx/game/loot_operations.hpp"

#include <string>

namespace lbx::game {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

BoxOpeningSystem::BoxOpeningSystem(lbx::ecs::ComponentStorage<OpenBoxRequest>& requests,
                                   lbx::ecs::ComponentStorage<Inventory>& inventories,
                                   const lbx::ecs::ComponentStorage<PlayerProfile>& profiles,
                                   lbx::ecs::ComponentStorage<ItemAcquiredEvent>& acquired,
                                   lbx::ecs::EntityManager& entities, LootBoxPool& pool,
                                   RandomSource& rng, LootFeed& feed)
    : requests_(requests),
      inventories_(inventories),
      profiles_(profiles),
      acquired_(acquired),
      entities_(entities),
      pool_(pool),
      rng_(rng),
      feed_(feed) {}

void BoxOpeningSystem::Execute(float /*deltaTime*/) {
    for (std::size_t i = 0; i < requests_.Size(); ++i) {
        lbx::ecs::Entity requestEntity(requests_.EntityAt(i), 0);
        auto& request = requests_.Get(requestEntity);

        if (request.processed || !request.chosen) {
            continue;
        }
        request.processed = true;

        const auto playerId = PlayerIdOf(profiles_, request.player);
        LogContext ctx;
        ctx.playerId = playerId;
        ctx.boxId = *request.chosen;

        auto* inventory = inventories_.Find(request.player);
        if (inventory == nullptr) {
            LBX_LOG_CTX(LogLevel::Warning, LogCategory::Loot, "Open request for unknown player",
                        ctx);
            feed_.Push(playerId, NotificationKind::ActionFailed, "player has no inventory",
                       ErrorCode::PlayerNotFound);
            continue;
        }

        auto opened = OpenBox(pool_, *request.chosen, *inventory, rng_);
        if (!opened) {
            LBX_LOG_CTX(LogLevel::Info, LogCategory::Loot,
                        "Box opening failed: " + std::string(opened.error().message()), ctx);
            feed_.Push(playerId, NotificationKind::ActionFailed,
                       std::string(opened.error().message()), opened.error().code());
            continue;
        }

        const Item& item = *inventory->Find(opened.value());
        auto eventEntity = entities_.Create();
        acquired_.Add(eventEntity, ItemAcquiredEvent{request.player, item});

        feed_.Push(playerId, NotificationKind::BoxOpened,
                   "Box " + std::to_string(request.chosen->value()) + " contained " +
                       item.Name() + " (" + std::string(rarityName(item.GetRarity())) + ")");
    }
}

}  // namespace lbx::game
