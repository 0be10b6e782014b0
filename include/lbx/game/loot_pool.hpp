#pragma once

/// @file loot_pool.hpp
/// @brief Loot boxes, the shared box pool, and box generation.
///
/// The pool is a world resource: every box in it is unopened, opening a
/// box removes it, and its size never exceeds the configured capacity.

#include "lbx/foundation/game_result.hpp"
#include "lbx/foundation/types.hpp"
#include "lbx/game/item_catalog.hpp"
#include "lbx/game/item_types.hpp"
#include "lbx/game/random_source.hpp"
#include "lbx/game/rarity.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string_view>
#include <vector>

namespace lbx::game {

/// Default number of boxes the pool holds at once.
constexpr std::size_t kDefaultPoolCapacity = 5;

/// Default number of candidate templates sampled per tier.
constexpr std::size_t kDefaultTemplatesPerTier = 2;

/// How a new box weights its rarity tiers.
enum class BoxDistribution : uint8_t {
    Uniform,  ///< Equal weight for every tier the box carries.
    Skewed,   ///< Configured rarity weights.
    Mixed     ///< Each box picks Uniform or Skewed with equal probability.
};

[[nodiscard]] std::string_view boxDistributionName(BoxDistribution d) noexcept;
[[nodiscard]] std::optional<BoxDistribution> parseBoxDistribution(std::string_view name) noexcept;

// -- LootBox ------------------------------------------------------------------

/// An unopened box: candidate templates per tier plus the tier weights.
///
/// Only tiers with at least one candidate appear in the table.
struct LootBox {
    foundation::BoxId id;
    std::array<std::vector<ItemTemplate>, kRarityCount> candidates;
    RarityTable table;
    BoxDistribution distribution = BoxDistribution::Skewed;

    [[nodiscard]] const std::vector<ItemTemplate>& CandidatesOf(Rarity r) const {
        return candidates[rarityIndex(r)];
    }

    [[nodiscard]] std::size_t CandidateCount() const noexcept;
};

// -- LootBoxPool --------------------------------------------------------------

/// Bounded, id-ordered collection of unopened boxes.
///
/// The pool also owns the monotonically increasing counters for box ids
/// and item instance ids, and the rarity profile whose value multipliers
/// apply to items opened from it.
class LootBoxPool {
public:
    explicit LootBoxPool(std::size_t capacity = kDefaultPoolCapacity,
                         RarityProfile profile = RarityProfile{});

    [[nodiscard]] std::size_t Capacity() const noexcept { return capacity_; }
    [[nodiscard]] std::size_t Size() const noexcept { return boxes_.size(); }
    [[nodiscard]] bool Empty() const noexcept { return boxes_.empty(); }
    [[nodiscard]] bool IsFull() const noexcept { return boxes_.size() >= capacity_; }
    [[nodiscard]] std::size_t FreeSlots() const noexcept {
        return IsFull() ? 0 : capacity_ - boxes_.size();
    }

    /// Add a box.
    ///
    /// @return PoolAtCapacity when full (pool unchanged), InvalidArgument
    ///         for a null id or a tier without candidates, AlreadyExists
    ///         for a duplicate id.
    foundation::GameResult<foundation::BoxId> Insert(LootBox box);

    [[nodiscard]] const LootBox* Find(foundation::BoxId id) const;
    [[nodiscard]] bool Contains(foundation::BoxId id) const { return boxes_.contains(id); }

    /// Lowest box id currently in the pool.
    [[nodiscard]] std::optional<foundation::BoxId> FirstId() const;

    /// Remove a box and hand it to the caller; nullopt if absent.
    [[nodiscard]] std::optional<LootBox> Extract(foundation::BoxId id);

    [[nodiscard]] const std::map<foundation::BoxId, LootBox>& Boxes() const noexcept {
        return boxes_;
    }

    /// Next box id.  Ids are never reused.
    [[nodiscard]] foundation::BoxId AllocateBoxId() noexcept {
        return foundation::BoxId{nextBoxId_++};
    }

    /// Next item instance id.  Ids are never reused.
    [[nodiscard]] foundation::ItemInstanceId AllocateItemId() noexcept {
        return foundation::ItemInstanceId{nextItemId_++};
    }

    [[nodiscard]] const RarityProfile& Profile() const noexcept { return profile_; }

    /// Boxes ever inserted / extracted.
    [[nodiscard]] uint64_t InsertedCount() const noexcept { return inserted_; }
    [[nodiscard]] uint64_t ExtractedCount() const noexcept { return extracted_; }

private:
    std::size_t capacity_;
    RarityProfile profile_;
    std::map<foundation::BoxId, LootBox> boxes_;
    uint64_t nextBoxId_ = 1;
    uint64_t nextItemId_ = 1;
    uint64_t inserted_ = 0;
    uint64_t extracted_ = 0;
};

// -- Generation ---------------------------------------------------------------

/// Build one box from the catalog.
///
/// For every tier present in @p base (Skewed) or in the catalog (Uniform),
/// up to @p templatesPerTier distinct templates are sampled as candidates.
///
/// @return CatalogEmpty when no tier ends up with a candidate,
///         InvalidArgument when @p templatesPerTier is 0.
[[nodiscard]] foundation::GameResult<LootBox> GenerateLootBox(
    foundation::BoxId id, const ItemCatalog& catalog, BoxDistribution distribution,
    std::size_t templatesPerTier, const RarityTable& base, RandomSource& rng);

/// Generate up to @p count boxes into @p pool, stopping at capacity.
///
/// @return Number of boxes added; PoolAtCapacity if the pool was already
///         full (nothing generated), or the generation error.
foundation::GameResult<std::size_t> GenerateBoxes(
    LootBoxPool& pool, std::size_t count, const ItemCatalog& catalog,
    BoxDistribution distribution, std::size_t templatesPerTier, const RarityTable& base,
    RandomSource& rng);

}  // namespace lbx::game
