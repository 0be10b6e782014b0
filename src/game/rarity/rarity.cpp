/// @file rarity.cpp
/// @brief Rarity traits and weighted tier draw.

#include "lbx/game/rarity.hpp"

#include <string>

namespace lbx::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

namespace {

constexpr std::array<std::string_view, kRarityCount> kNames = {
    "Common", "Uncommon", "Rare", "Epic", "Legendary"};

constexpr std::array<std::string_view, kRarityCount> kKeys = {
    "common", "uncommon", "rare", "epic", "legendary"};

constexpr std::array<RarityTraits, kRarityCount> kDefaults = {{
    {60.0, 1.0},
    {25.0, 1.5},
    {10.0, 2.5},
    {4.0, 5.0},
    {1.0, 10.0},
}};

GameResult<void> rejectNonPositive(Rarity r, double value, std::string_view what) {
    return GameResult<void>::err(GameError(
        ErrorCode::InvalidArgument,
        std::string(what) + " for " + std::string(rarityName(r)) +
            " must be positive, got " + std::to_string(value)));
}

} // namespace

std::string_view rarityName(Rarity r) noexcept {
    auto idx = rarityIndex(r);
    return idx < kRarityCount ? kNames[idx] : "Unknown";
}

std::string_view rarityKey(Rarity r) noexcept {
    auto idx = rarityIndex(r);
    return idx < kRarityCount ? kKeys[idx] : "unknown";
}

std::optional<Rarity> parseRarity(std::string_view key) noexcept {
    for (auto r : kAllRarities) {
        if (kKeys[rarityIndex(r)] == key || kNames[rarityIndex(r)] == key) {
            return r;
        }
    }
    return std::nullopt;
}

RarityTraits TraitsOf(Rarity r) noexcept {
    return kDefaults[rarityIndex(r)];
}

// -- RarityTable --------------------------------------------------------------

RarityTable RarityTable::Default() {
    RarityTable table;
    for (auto r : kAllRarities) {
        table.weights_[rarityIndex(r)] = kDefaults[rarityIndex(r)].weight;
    }
    return table;
}

RarityTable RarityTable::Uniform() {
    RarityTable table;
    table.weights_.fill(1.0);
    return table;
}

GameResult<void> RarityTable::SetWeight(Rarity r, double weight) {
    // NaN fails this comparison as well.
    if (!(weight > 0.0)) {
        return rejectNonPositive(r, weight, "weight");
    }
    weights_[rarityIndex(r)] = weight;
    return GameResult<void>::ok();
}

double RarityTable::TotalWeight() const noexcept {
    double total = 0.0;
    for (double w : weights_) {
        total += w;
    }
    return total;
}

double RarityTable::Probability(Rarity r) const noexcept {
    const double total = TotalWeight();
    return total > 0.0 ? Weight(r) / total : 0.0;
}

GameResult<Rarity> DrawRarity(const RarityTable& table, RandomSource& rng) {
    const double total = table.TotalWeight();
    if (total <= 0.0) {
        return GameResult<Rarity>::err(
            GameError(ErrorCode::InvalidArgument, "cannot draw from an empty rarity table"));
    }

    const double roll = rng.NextUnit() * total;
    double cumulative = 0.0;
    std::optional<Rarity> last;
    for (auto r : kAllRarities) {
        const double w = table.Weight(r);
        if (w <= 0.0) {
            continue;
        }
        cumulative += w;
        last = r;
        if (roll < cumulative) {
            return GameResult<Rarity>::ok(r);
        }
    }
    // Floating-point rounding can leave roll == total; the top present tier owns it.
    return GameResult<Rarity>::ok(*last);
}

// -- RarityProfile ------------------------------------------------------------

RarityProfile::RarityProfile() {
    for (auto r : kAllRarities) {
        traits_[rarityIndex(r)] = kDefaults[rarityIndex(r)];
    }
}

GameResult<void> RarityProfile::SetWeight(Rarity r, double weight) {
    if (!(weight > 0.0)) {
        return rejectNonPositive(r, weight, "weight");
    }
    traits_[rarityIndex(r)].weight = weight;
    return GameResult<void>::ok();
}

GameResult<void> RarityProfile::SetValueMultiplier(Rarity r, double multiplier) {
    if (!(multiplier > 0.0)) {
        return rejectNonPositive(r, multiplier, "value multiplier");
    }
    traits_[rarityIndex(r)].valueMultiplier = multiplier;
    return GameResult<void>::ok();
}

RarityTable RarityProfile::SelectionTable() const {
    RarityTable table;
    for (auto r : kAllRarities) {
        // Profile weights are always positive, so this cannot fail.
        (void)table.SetWeight(r, traits_[rarityIndex(r)].weight);
    }
    return table;
}

}  // namespace lbx::game
