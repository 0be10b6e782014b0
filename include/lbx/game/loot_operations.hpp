#pragma once

/// @file loot_operations.hpp
/// @brief Player-facing loot operations: choose, open, equip, unequip, sell.
///
/// These are plain functions over components and resources so systems and
/// the plugin's immediate API share one implementation.  Every operation
/// either succeeds completely or leaves its arguments untouched.

#include "lbx/foundation/game_result.hpp"
#include "lbx/foundation/types.hpp"
#include "lbx/game/loot_pool.hpp"
#include "lbx/game/player_components.hpp"
#include "lbx/game/random_source.hpp"

#include <cstdint>
#include <string_view>

namespace lbx::game {

/// Which box a player wants to open.
struct BoxSelection {
    enum class Mode : uint8_t {
        Explicit,  ///< The box named by boxId.
        AutoFirst  ///< Lowest id in the pool.
    };

    Mode mode = Mode::AutoFirst;
    foundation::BoxId boxId;

    [[nodiscard]] static BoxSelection Explicit(foundation::BoxId id) {
        return BoxSelection{Mode::Explicit, id};
    }
    [[nodiscard]] static BoxSelection AutoFirst() { return BoxSelection{Mode::AutoFirst, {}}; }
};

/// Resolve @p selection against the pool.  No side effects.
///
/// @return BoxNotFound for an explicit id not in the pool,
///         PoolEmpty for AutoFirst on an empty pool.
[[nodiscard]] foundation::GameResult<const LootBox*> ChooseBox(const LootBoxPool& pool,
                                                               const BoxSelection& selection);

/// Open a box into @p inventory.
///
/// The box leaves the pool before the draw, so it can never be opened
/// twice.  The tier is drawn with the box's table and the template picked
/// uniformly among that tier's candidates.
///
/// @return New item's instance id; BoxNotFound leaves pool and inventory untouched.
[[nodiscard]] foundation::GameResult<foundation::ItemInstanceId> OpenBox(
    LootBoxPool& pool, foundation::BoxId boxId, Inventory& inventory, RandomSource& rng);

/// Point @p equipment at an item of @p inventory, replacing any previous choice.
///
/// @return ItemNotInInventory if the item is not owned.
foundation::GameResult<void> EquipItem(const Inventory& inventory, Equipment& equipment,
                                       foundation::ItemInstanceId itemId);

/// Clear the equipped reference.  @return true if something was equipped.
bool UnequipItem(Equipment& equipment) noexcept;

/// Sell an item for its Value().
///
/// Removes the item, credits the wallet, and clears the equipped
/// reference if it pointed at the sold item.
///
/// @return Amount credited; ItemNotInInventory leaves everything untouched.
[[nodiscard]] foundation::GameResult<int64_t> SellItem(Inventory& inventory,
                                                       Equipment& equipment, Wallet& wallet,
                                                       foundation::ItemInstanceId itemId);

}  // namespace lbx::game
