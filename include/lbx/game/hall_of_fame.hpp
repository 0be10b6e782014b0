#pragma once

/// @file hall_of_fame.hpp
/// @brief Ranked player leaderboard resource.

#include "lbx/foundation/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lbx::game {

/// One leaderboard row.
struct HallOfFameEntry {
    foundation::PlayerId playerId;
    std::string name;
    uint32_t level = 1;
    int64_t score = 0;      ///< Total experience.
    uint64_t sequence = 0;  ///< Order of the update that produced this row.
};

/// Player leaderboard, one row per player.
///
/// Rows are kept sorted by level (descending), then score (descending),
/// then sequence (ascending: whoever got there first ranks higher).
class HallOfFame {
public:
    /// Insert or replace the row of @p playerId and re-sort.
    void Record(foundation::PlayerId playerId, std::string name, uint32_t level, int64_t score);

    /// Up to @p n best rows.
    [[nodiscard]] std::vector<HallOfFameEntry> Top(std::size_t n) const;

    /// 1-based rank, or nullopt for an unranked player.
    [[nodiscard]] std::optional<std::size_t> RankOf(foundation::PlayerId playerId) const;

    [[nodiscard]] const HallOfFameEntry* Find(foundation::PlayerId playerId) const;

    [[nodiscard]] const std::vector<HallOfFameEntry>& Entries() const noexcept { return entries_; }
    [[nodiscard]] std::size_t Size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool Empty() const noexcept { return entries_.empty(); }

    /// Number of Record() calls so far.
    [[nodiscard]] uint64_t UpdateCount() const noexcept { return nextSequence_; }

private:
    std::vector<HallOfFameEntry> entries_;
    uint64_t nextSequence_ = 0;
};

}  // namespace lbx::game
