#pragma once

/// @file item_catalog.hpp
/// @brief Registry of item templates, indexed by rarity tier.

#include "lbx/foundation/game_result.hpp"
#include "lbx/game/item_types.hpp"
#include "lbx/game/rarity.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace lbx::game {

/// Item templates that loot boxes draw their candidates from.
class ItemCatalog {
public:
    ItemCatalog() = default;

    // byRarity_ points into templates_; moving keeps the nodes, copying would not.
    ItemCatalog(const ItemCatalog&) = delete;
    ItemCatalog& operator=(const ItemCatalog&) = delete;
    ItemCatalog(ItemCatalog&&) noexcept = default;
    ItemCatalog& operator=(ItemCatalog&&) noexcept = default;

    /// Catalog with the built-in templates (three per tier).
    [[nodiscard]] static ItemCatalog Builtin();

    /// Register a template.
    ///
    /// @return InvalidArgument for id 0 or a negative base value,
    ///         AlreadyExists for a duplicate id.
    foundation::GameResult<void> RegisterTemplate(ItemTemplate tmpl);

    /// Registered template, or nullptr.
    [[nodiscard]] const ItemTemplate* GetTemplate(uint32_t templateId) const;

    /// Templates of @p rarity in registration order.
    [[nodiscard]] const std::vector<const ItemTemplate*>& TemplatesOf(Rarity rarity) const {
        return byRarity_[rarityIndex(rarity)];
    }

    [[nodiscard]] std::size_t Size() const noexcept { return templates_.size(); }
    [[nodiscard]] bool Empty() const noexcept { return templates_.empty(); }

private:
    std::unordered_map<uint32_t, ItemTemplate> templates_;
    std::array<std::vector<const ItemTemplate*>, kRarityCount> byRarity_;
};

}  // namespace lbx::game
