/// @file box_choice_system.cpp
/// @brief BoxChoiceSystem implementation.

#include "lbx/game/box_choice_system.hpp"

#include "lbx/foundation/game_logger.hpp"
#include "lbx/game/loot_operations.hpp"

#include <set>

namespace lbx::game {

using foundation::BoxId;
using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

BoxChoiceSystem::BoxChoiceSystem(lbx::ecs::ComponentStorage<OpenBoxRequest>& requests,
                                 const LootBoxPool& pool,
                                 const lbx::ecs::ComponentStorage<PlayerProfile>& profiles,
                                 LootFeed& feed)
    : requests_(requests), pool_(pool), profiles_(profiles), feed_(feed) {}

void BoxChoiceSystem::Execute(float /*deltaTime*/) {
    // Boxes already promised to a pending request.
    std::set<BoxId> claimed;
    for (const auto& request : requests_) {
        if (!request.processed && request.chosen) {
            claimed.insert(*request.chosen);
        }
    }

    for (auto& request : requests_) {
        if (request.processed || request.chosen) {
            continue;
        }

        GameResult<const LootBox*> choice = ChooseBox(pool_, request.selection);
        if (choice && request.selection.mode == BoxSelection::Mode::AutoFirst &&
            claimed.contains(choice.value()->id)) {
            const LootBox* next = nullptr;
            for (const auto& [id, box] : pool_.Boxes()) {
                if (!claimed.contains(id)) {
                    next = &box;
                    break;
                }
            }
            choice = next != nullptr
                         ? GameResult<const LootBox*>::ok(next)
                         : GameResult<const LootBox*>::err(GameError(
                               ErrorCode::PoolEmpty, "every loot box is already claimed"));
        }

        const auto playerId = PlayerIdOf(profiles_, request.player);
        if (!choice) {
            LogContext ctx;
            ctx.playerId = playerId;
            LBX_LOG_CTX(LogLevel::Info, LogCategory::Loot,
                        "Box choice failed: " + std::string(choice.error().message()), ctx);
            feed_.Push(playerId, NotificationKind::ActionFailed,
                       std::string(choice.error().message()), choice.error().code());
            request.processed = true;
            continue;
        }

        request.chosen = choice.value()->id;
        claimed.insert(*request.chosen);
    }
}

}  // namespace lbx::game
