#pragma once

/// @file player_components.hpp
/// @brief Player ECS components: PlayerProfile, Inventory, Equipment, Wallet, Progression.
///
/// Each struct is a plain data component designed for sparse-set storage
/// via ComponentStorage<T>.  Operations that must keep several of them
/// consistent (equip, sell, experience grants) live in loot_operations.hpp
/// and progression.hpp.

#include "lbx/ecs/component_storage.hpp"
#include "lbx/ecs/entity.hpp"
#include "lbx/foundation/types.hpp"
#include "lbx/game/item_types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace lbx::game {

// -- PlayerProfile ------------------------------------------------------------

struct PlayerProfile {
    foundation::PlayerId id;
    std::string name;
};

// -- Inventory ----------------------------------------------------------------

/// Items owned by a player, ordered by instance id.
struct Inventory {
    std::map<foundation::ItemInstanceId, Item> items;

    [[nodiscard]] bool Contains(foundation::ItemInstanceId id) const { return items.contains(id); }

    [[nodiscard]] const Item* Find(foundation::ItemInstanceId id) const {
        auto it = items.find(id);
        return it != items.end() ? &it->second : nullptr;
    }

    [[nodiscard]] std::size_t Size() const noexcept { return items.size(); }

    /// Sum of Value() over every item.
    [[nodiscard]] int64_t TotalValue() const noexcept {
        int64_t total = 0;
        for (const auto& [id, item] : items) {
            total += item.Value();
        }
        return total;
    }
};

// -- Equipment ----------------------------------------------------------------

/// The single equipped item, as a key into the owner's Inventory.
///
/// Invariant: when set, the id is present in the same player's Inventory.
struct Equipment {
    std::optional<foundation::ItemInstanceId> equipped;

    [[nodiscard]] bool IsEquipped(foundation::ItemInstanceId id) const noexcept {
        return equipped.has_value() && *equipped == id;
    }
};

// -- Wallet -------------------------------------------------------------------

/// Currency balance, never negative.
struct Wallet {
    int64_t currency = 0;
};

// -- Progression --------------------------------------------------------------

/// Level and accumulated experience.  Neither ever decreases.
struct Progression {
    uint32_t level = 1;
    int64_t experience = 0;
};

/// PlayerId of @p player, or the null id when it has no profile.
[[nodiscard]] inline foundation::PlayerId PlayerIdOf(
    const lbx::ecs::ComponentStorage<PlayerProfile>& profiles, lbx::ecs::Entity player) {
    const auto* profile = profiles.Find(player);
    return profile != nullptr ? profile->id : foundation::PlayerId{};
}

}  // namespace lbx::game
