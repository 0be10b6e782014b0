#pragma once

/// @file rarity.hpp
/// @brief Rarity tiers, their traits, and the weighted tier draw.

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include "lbx/foundation/game_result.hpp"
#include "lbx/game/random_source.hpp"

namespace lbx::game {

/// Rarity tier.  Declaration order is rank order: Common < ... < Legendary.
enum class Rarity : uint8_t { Common, Uncommon, Rare, Epic, Legendary };

inline constexpr std::size_t kRarityCount = 5;

inline constexpr std::array<Rarity, kRarityCount> kAllRarities = {
    Rarity::Common, Rarity::Uncommon, Rarity::Rare, Rarity::Epic, Rarity::Legendary};

[[nodiscard]] constexpr std::size_t rarityIndex(Rarity r) noexcept {
    return static_cast<std::size_t>(r);
}

/// Display name ("Common", "Legendary", ...).
[[nodiscard]] std::string_view rarityName(Rarity r) noexcept;

/// Lower-case config key ("common", "legendary", ...).
[[nodiscard]] std::string_view rarityKey(Rarity r) noexcept;

/// Parse a config key; nullopt for unknown names.
[[nodiscard]] std::optional<Rarity> parseRarity(std::string_view key) noexcept;

/// Selection weight and value multiplier of a tier.
struct RarityTraits {
    double weight = 1.0;           ///< Relative draw weight, > 0.
    double valueMultiplier = 1.0;  ///< Applied to an item's base value, > 0.
};

/// Built-in traits: weights 60/25/10/4/1, multipliers 1/1.5/2.5/5/10.
[[nodiscard]] RarityTraits TraitsOf(Rarity r) noexcept;

// -- RarityTable --------------------------------------------------------------

/// Draw weights over a subset of tiers.
///
/// A tier is either absent (weight 0) or present with a strictly positive
/// weight; SetWeight() refuses anything else.
class RarityTable {
public:
    RarityTable() = default;

    /// All tiers with the built-in default weights.
    [[nodiscard]] static RarityTable Default();

    /// All tiers with weight 1.
    [[nodiscard]] static RarityTable Uniform();

    /// Add or update a tier.  InvalidArgument unless weight > 0.
    foundation::GameResult<void> SetWeight(Rarity r, double weight);

    /// Drop a tier from the table.
    void Exclude(Rarity r) noexcept { weights_[rarityIndex(r)] = 0.0; }

    [[nodiscard]] double Weight(Rarity r) const noexcept { return weights_[rarityIndex(r)]; }
    [[nodiscard]] bool Contains(Rarity r) const noexcept { return Weight(r) > 0.0; }
    [[nodiscard]] double TotalWeight() const noexcept;
    [[nodiscard]] bool Empty() const noexcept { return TotalWeight() <= 0.0; }

    /// weight(r) / TotalWeight(), 0 for absent tiers or an empty table.
    [[nodiscard]] double Probability(Rarity r) const noexcept;

private:
    std::array<double, kRarityCount> weights_{};
};

/// Draw one tier with probability weight(T) / sum(weights).
///
/// Advances @p rng by exactly one step.
/// @return InvalidArgument if the table is empty.
[[nodiscard]] foundation::GameResult<Rarity> DrawRarity(const RarityTable& table,
                                                        RandomSource& rng);

// -- RarityProfile ------------------------------------------------------------

/// Per-tier traits in effect for a session (defaults overridable by config).
class RarityProfile {
public:
    RarityProfile();

    [[nodiscard]] const RarityTraits& Traits(Rarity r) const noexcept {
        return traits_[rarityIndex(r)];
    }

    /// InvalidArgument unless weight > 0.
    foundation::GameResult<void> SetWeight(Rarity r, double weight);

    /// InvalidArgument unless multiplier > 0.
    foundation::GameResult<void> SetValueMultiplier(Rarity r, double multiplier);

    /// Selection table over every tier using this profile's weights.
    [[nodiscard]] RarityTable SelectionTable() const;

private:
    std::array<RarityTraits, kRarityCount> traits_;
};

}  // namespace lbx::game
