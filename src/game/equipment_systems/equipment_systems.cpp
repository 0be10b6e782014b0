/// @file equipment_systems.cpp
/// @brief EquipSystem and SellSystem implementation.

#include "lbx/game/equipment_systems.hpp"

#include "lbx/foundation/game_logger.hpp"
#include "lbx/game/loot_operations.hpp"

#include <string>

namespace lbx::game {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

// -- EquipSystem --------------------------------------------------------------

EquipSystem::EquipSystem(lbx::ecs::ComponentStorage<EquipRequest>& requests,
                         const lbx::ecs::ComponentStorage<Inventory>& inventories,
                         lbx::ecs::ComponentStorage<Equipment>& equipment,
                         const lbx::ecs::ComponentStorage<PlayerProfile>& profiles,
                         LootFeed& feed)
    : requests_(requests),
      inventories_(inventories),
      equipment_(equipment),
      profiles_(profiles),
      feed_(feed) {}

void EquipSystem::Execute(float /*deltaTime*/) {
    for (auto& request : requests_) {
        if (request.processed) {
            continue;
        }
        request.processed = true;

        const auto playerId = PlayerIdOf(profiles_, request.player);
        const auto* inventory = inventories_.Find(request.player);
        auto* equipment = equipment_.Find(request.player);
        if (inventory == nullptr || equipment == nullptr) {
            feed_.Push(playerId, NotificationKind::ActionFailed, "player cannot equip items",
                       ErrorCode::PlayerNotFound);
            continue;
        }

        LogContext ctx;
        ctx.playerId = playerId;
        ctx.itemId = request.item;

        auto equipped = EquipItem(*inventory, *equipment, request.item);
        if (!equipped) {
            LBX_LOG_CTX(LogLevel::Info, LogCategory::Economy,
                        "Equip failed: " + std::string(equipped.error().message()), ctx);
            feed_.Push(playerId, NotificationKind::ActionFailed,
                       std::string(equipped.error().message()), equipped.error().code());
            continue;
        }

        LBX_LOG_CTX(LogLevel::Debug, LogCategory::Economy, "Equipped item", ctx);
        feed_.Push(playerId, NotificationKind::ItemEquipped,
                   "Equipped " + inventory->Find(request.item)->Name());
    }
}

// -- SellSystem ---------------------------------------------------------------

SellSystem::SellSystem(lbx::ecs::ComponentStorage<SellRequest>& requests,
                       lbx::ecs::ComponentStorage<Inventory>& inventories,
                       lbx::ecs::ComponentStorage<Equipment>& equipment,
                       lbx::ecs::ComponentStorage<Wallet>& wallets,
                       const lbx::ecs::ComponentStorage<PlayerProfile>& profiles, LootFeed& feed)
    : requests_(requests),
      inventories_(inventories),
      equipment_(equipment),
      wallets_(wallets),
      profiles_(profiles),
      feed_(feed) {}

void SellSystem::Execute(float /*deltaTime*/) {
    for (auto& request : requests_) {
        if (request.processed) {
            continue;
        }
        request.processed = true;

        const auto playerId = PlayerIdOf(profiles_, request.player);
        auto* inventory = inventories_.Find(request.player);
        auto* equipment = equipment_.Find(request.player);
        auto* wallet = wallets_.Find(request.player);
        if (inventory == nullptr || equipment == nullptr || wallet == nullptr) {
            feed_.Push(playerId, NotificationKind::ActionFailed, "player cannot sell items",
                       ErrorCode::PlayerNotFound);
            continue;
        }

        std::string itemName;
        if (const auto* item = inventory->Find(request.item)) {
            itemName = item->Name();
        }

        auto sold = SellItem(*inventory, *equipment, *wallet, request.item);
        if (!sold) {
            LogContext ctx;
            ctx.playerId = playerId;
            ctx.itemId = request.item;
            LBX_LOG_CTX(LogLevel::Info, LogCategory::Economy,
                        "Sell failed: " + std::string(sold.error().message()), ctx);
            feed_.Push(playerId, NotificationKind::ActionFailed,
                       std::string(sold.error().message()), sold.error().code());
            continue;
        }

        feed_.Push(playerId, NotificationKind::ItemSold,
                   "Sold " + itemName + " for " + std::to_string(sold.value()));
    }
}

}  // namespace lbx::game
