#pragma once

/// @file item_types.hpp
/// @brief Item templates and concrete item instances.

#include "lbx/foundation/types.hpp"
#include "lbx/game/rarity.hpp"

#include <cmath>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace lbx::game {

/// Item classification.
enum class ItemKind : uint8_t { Weapon, Armor, Accessory, Trinket };

[[nodiscard]] constexpr std::string_view itemKindName(ItemKind kind) noexcept {
    switch (kind) {
        case ItemKind::Weapon:    return "Weapon";
        case ItemKind::Armor:     return "Armor";
        case ItemKind::Accessory: return "Accessory";
        case ItemKind::Trinket:   return "Trinket";
    }
    return "Unknown";
}

/// Attribute touched by a stat modifier.
enum class Stat : uint8_t { Attack, Defense, Speed, Luck };

// -- StatModifier -------------------------------------------------------------

/// Flat additive bonus granted while an item is equipped.
struct StatModifier {
    Stat stat = Stat::Attack;
    int32_t amount = 0;

    bool operator==(const StatModifier&) const = default;
};

// -- ItemTemplate -------------------------------------------------------------

/// Static item definition (shared, not per-entity).
struct ItemTemplate {
    uint32_t id = 0;
    std::string name;
    ItemKind kind = ItemKind::Trinket;
    Rarity rarity = Rarity::Common;
    int64_t baseValue = 0;
    std::vector<StatModifier> modifiers;
};

// -- Item ---------------------------------------------------------------------

/// A concrete item instance produced by opening a box.
///
/// Items are immutable once created.  The rarity multiplier in effect at
/// creation is captured so the sale value never drifts.
class Item {
public:
    Item(foundation::ItemInstanceId instanceId, const ItemTemplate& tmpl,
         double valueMultiplier)
        : instanceId_(instanceId),
          templateId_(tmpl.id),
          name_(tmpl.name),
          kind_(tmpl.kind),
          rarity_(tmpl.rarity),
          baseValue_(tmpl.baseValue),
          valueMultiplier_(valueMultiplier),
          modifiers_(tmpl.modifiers) {}

    [[nodiscard]] foundation::ItemInstanceId InstanceId() const noexcept { return instanceId_; }
    [[nodiscard]] uint32_t TemplateId() const noexcept { return templateId_; }
    [[nodiscard]] const std::string& Name() const noexcept { return name_; }
    [[nodiscard]] ItemKind Kind() const noexcept { return kind_; }
    [[nodiscard]] Rarity GetRarity() const noexcept { return rarity_; }
    [[nodiscard]] int64_t BaseValue() const noexcept { return baseValue_; }
    [[nodiscard]] double ValueMultiplier() const noexcept { return valueMultiplier_; }
    [[nodiscard]] const std::vector<StatModifier>& Modifiers() const noexcept { return modifiers_; }

    /// Sale value: base value scaled by the rarity multiplier, rounded.
    [[nodiscard]] int64_t Value() const noexcept {
        return static_cast<int64_t>(
            std::llround(static_cast<double>(baseValue_) * valueMultiplier_));
    }

private:
    foundation::ItemInstanceId instanceId_;
    uint32_t templateId_;
    std::string name_;
    ItemKind kind_;
    Rarity rarity_;
    int64_t baseValue_;
    double valueMultiplier_;
    std::vector<StatModifier> modifiers_;
};

}  // namespace lbx::game
