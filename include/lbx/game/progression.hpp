#pragma once

/// @file progression.hpp
/// @brief Experience curve and experience grants with multi-level cascade.

#include "lbx/foundation/game_result.hpp"
#include "lbx/game/item_types.hpp"
#include "lbx/game/player_components.hpp"

#include <cstdint>

namespace lbx::game {

/// Cumulative experience curve.
///
/// Threshold(level) is the total experience needed to leave @p level,
/// i.e. to reach level + 1.  Strictly increasing for growth > 0.
struct ExperienceCurve {
    double base = 100.0;
    double growth = 1.5;

    /// llround(base * level^growth).
    [[nodiscard]] int64_t Threshold(uint32_t level) const noexcept;

    /// Level reached with @p experience total, never below 1.
    [[nodiscard]] uint32_t LevelFor(int64_t experience) const noexcept;
};

/// Experience granted for acquiring @p item: llround(Value() * xpPerValue).
[[nodiscard]] int64_t ExperienceForItem(const Item& item, double xpPerValue) noexcept;

/// Levels before and after a grant.
struct LevelChange {
    uint32_t fromLevel = 1;
    uint32_t toLevel = 1;

    [[nodiscard]] bool LeveledUp() const noexcept { return toLevel > fromLevel; }
    [[nodiscard]] uint32_t Gained() const noexcept { return toLevel - fromLevel; }
};

/// Add @p amount experience and apply every threshold crossed.
///
/// @return InvalidArgument for a negative amount (progression untouched).
foundation::GameResult<LevelChange> GrantExperience(Progression& progression, int64_t amount,
                                                    const ExperienceCurve& curve);

}  // namespace lbx::game
