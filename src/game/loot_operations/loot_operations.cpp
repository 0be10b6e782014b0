/// @file loot_operations.cpp
/// @brief Choose, open, equip, unequip and sell.

#include "lbx/game/loot_operations.hpp"

#include "lbx/foundation/game_logger.hpp"

#include <string>
#include <utility>

namespace lbx::game {

using foundation::BoxId;
using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::ItemInstanceId;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

GameError boxNotFound(BoxId id) {
    return GameError(ErrorCode::BoxNotFound,
                     "loot box " + std::to_string(id.value()) + " is not in the pool");
}

GameError itemNotInInventory(ItemInstanceId id) {
    return GameError(ErrorCode::ItemNotInInventory,
                     "item " + std::to_string(id.value()) + " is not in the inventory");
}

} // namespace

GameResult<const LootBox*> ChooseBox(const LootBoxPool& pool, const BoxSelection& selection) {
    switch (selection.mode) {
        case BoxSelection::Mode::Explicit:
            if (const auto* box = pool.Find(selection.boxId)) {
                return GameResult<const LootBox*>::ok(box);
            }
            return GameResult<const LootBox*>::err(boxNotFound(selection.boxId));

        case BoxSelection::Mode::AutoFirst:
            if (auto first = pool.FirstId()) {
                return GameResult<const LootBox*>::ok(pool.Find(*first));
            }
            return GameResult<const LootBox*>::err(
                GameError(ErrorCode::PoolEmpty, "no loot box available"));
    }
    return GameResult<const LootBox*>::err(
        GameError(ErrorCode::InvalidArgument, "unknown box selection mode"));
}

GameResult<ItemInstanceId> OpenBox(LootBoxPool& pool, BoxId boxId, Inventory& inventory,
                                   RandomSource& rng) {
    auto box = pool.Extract(boxId);
    if (!box) {
        return GameResult<ItemInstanceId>::err(boxNotFound(boxId));
    }

    // The pool only accepts boxes whose every present tier has candidates.
    auto rarity = DrawRarity(box->table, rng);
    if (!rarity) {
        return GameResult<ItemInstanceId>::err(rarity.error());
    }
    const auto& candidates = box->CandidatesOf(rarity.value());
    const auto& tmpl = candidates[rng.NextIndex(candidates.size())];

    const auto itemId = pool.AllocateItemId();
    const double multiplier = pool.Profile().Traits(tmpl.rarity).valueMultiplier;
    auto it = inventory.items.emplace(itemId, Item(itemId, tmpl, multiplier)).first;

    LogContext ctx;
    ctx.boxId = boxId;
    ctx.itemId = itemId;
    ctx.extra["rarity"] = std::string(rarityName(it->second.GetRarity()));
    ctx.extra["item"] = it->second.Name();
    LBX_LOG_CTX(LogLevel::Debug, LogCategory::Loot, "Opened loot box", ctx);

    return GameResult<ItemInstanceId>::ok(itemId);
}

GameResult<void> EquipItem(const Inventory& inventory, Equipment& equipment,
                           ItemInstanceId itemId) {
    if (!inventory.Contains(itemId)) {
        return GameResult<void>::err(itemNotInInventory(itemId));
    }
    equipment.equipped = itemId;
    return GameResult<void>::ok();
}

bool UnequipItem(Equipment& equipment) noexcept {
    const bool had = equipment.equipped.has_value();
    equipment.equipped.reset();
    return had;
}

GameResult<int64_t> SellItem(Inventory& inventory, Equipment& equipment, Wallet& wallet,
                             ItemInstanceId itemId) {
    auto it = inventory.items.find(itemId);
    if (it == inventory.items.end()) {
        return GameResult<int64_t>::err(itemNotInInventory(itemId));
    }

    const int64_t proceeds = it->second.Value();
    inventory.items.erase(it);
    if (equipment.IsEquipped(itemId)) {
        equipment.equipped.reset();
    }
    wallet.currency += proceeds;

    LogContext ctx;
    ctx.itemId = itemId;
    ctx.extra["proceeds"] = std::to_string(proceeds);
    ctx.extra["balance"] = std::to_string(wallet.currency);
    LBX_LOG_CTX(LogLevel::Debug, LogCategory::Economy, "Sold item", ctx);

    return GameResult<int64_t>::ok(proceeds);
}

}  // namespace lbx::game
