/// @file item_catalog.cpp
/// @brief ItemCatalog registration and the built-in template set.

#include "lbx/game/item_catalog.hpp"

#include <string>
#include <utility>

namespace lbx::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

ItemCatalog ItemCatalog::Builtin() {
    ItemCatalog catalog;
    const ItemTemplate builtins[] = {
        {1001, "Rusty Sword", ItemKind::Weapon, Rarity::Common, 10, {{Stat::Attack, 1}}},
        {1002, "Padded Vest", ItemKind::Armor, Rarity::Common, 12, {{Stat::Defense, 1}}},
        {1003, "Copper Ring", ItemKind::Accessory, Rarity::Common, 8, {{Stat::Luck, 1}}},

        {2001, "Iron Blade", ItemKind::Weapon, Rarity::Uncommon, 20, {{Stat::Attack, 3}}},
        {2002, "Chain Shirt", ItemKind::Armor, Rarity::Uncommon, 22, {{Stat::Defense, 3}}},
        {2003, "Swift Boots", ItemKind::Armor, Rarity::Uncommon, 18, {{Stat::Speed, 2}}},

        {3001, "Runed Axe", ItemKind::Weapon, Rarity::Rare, 35,
         {{Stat::Attack, 6}, {Stat::Speed, -1}}},
        {3002, "Warden Plate", ItemKind::Armor, Rarity::Rare, 40, {{Stat::Defense, 6}}},
        {3003, "Lucky Charm", ItemKind::Trinket, Rarity::Rare, 30, {{Stat::Luck, 5}}},

        {4001, "Stormcaller", ItemKind::Weapon, Rarity::Epic, 60,
         {{Stat::Attack, 10}, {Stat::Speed, 2}}},
        {4002, "Aegis Mantle", ItemKind::Armor, Rarity::Epic, 65, {{Stat::Defense, 11}}},
        {4003, "Phoenix Feather", ItemKind::Trinket, Rarity::Epic, 55,
         {{Stat::Luck, 6}, {Stat::Speed, 3}}},

        {5001, "Dawnbreaker", ItemKind::Weapon, Rarity::Legendary, 100,
         {{Stat::Attack, 18}, {Stat::Luck, 4}}},
        {5002, "Crown of Ages", ItemKind::Accessory, Rarity::Legendary, 120,
         {{Stat::Defense, 8}, {Stat::Luck, 8}}},
        {5003, "Void Compass", ItemKind::Trinket, Rarity::Legendary, 90,
         {{Stat::Speed, 10}}},
    };
    for (const auto& tmpl : builtins) {
        // Built-in ids are unique and values non-negative.
        (void)catalog.RegisterTemplate(tmpl);
    }
    return catalog;
}

GameResult<void> ItemCatalog::RegisterTemplate(ItemTemplate tmpl) {
    if (tmpl.id == 0) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidArgument, "item template id 0 is reserved"));
    }
    if (tmpl.baseValue < 0) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidArgument,
                      "item template " + std::to_string(tmpl.id) + " has a negative base value"));
    }
    if (templates_.contains(tmpl.id)) {
        return GameResult<void>::err(
            GameError(ErrorCode::AlreadyExists,
                      "item template " + std::to_string(tmpl.id) + " is already registered"));
    }

    const auto id = tmpl.id;
    const auto rarity = tmpl.rarity;
    auto it = templates_.emplace(id, std::move(tmpl)).first;
    byRarity_[rarityIndex(rarity)].push_back(&it->second);
    return GameResult<void>::ok();
}

const ItemTemplate* ItemCatalog::GetTemplate(uint32_t templateId) const {
    if (auto it = templates_.find(templateId); it != templates_.end()) {
        return &it->second;
    }
    return nullptr;
}

}  // namespace lbx::game
