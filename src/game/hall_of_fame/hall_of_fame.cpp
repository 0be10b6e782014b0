/// @file hall_of_fame.cpp
/// @brief HallOfFame upsert and ranking.

#include "lbx/game/hall_of_fame.hpp"

#include <algorithm>
#include <utility>

namespace lbx::game {

using foundation::PlayerId;

namespace {

bool ranksBefore(const HallOfFameEntry& a, const HallOfFameEntry& b) noexcept {
    if (a.level != b.level) {
        return a.level > b.level;
    }
    if (a.score != b.score) {
        return a.score > b.score;
    }
    return a.sequence < b.sequence;
}

} // namespace

void HallOfFame::Record(PlayerId playerId, std::string name, uint32_t level, int64_t score) {
    const uint64_t sequence = nextSequence_++;

    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const HallOfFameEntry& e) { return e.playerId == playerId; });
    if (it != entries_.end()) {
        it->name = std::move(name);
        it->level = level;
        it->score = score;
        it->sequence = sequence;
    } else {
        entries_.push_back(HallOfFameEntry{playerId, std::move(name), level, score, sequence});
    }

    // Sequences are unique, so the order is total and stability is moot.
    std::sort(entries_.begin(), entries_.end(), ranksBefore);
}

std::vector<HallOfFameEntry> HallOfFame::Top(std::size_t n) const {
    const auto count = std::min(n, entries_.size());
    return {entries_.begin(), entries_.begin() + static_cast<std::ptrdiff_t>(count)};
}

std::optional<std::size_t> HallOfFame::RankOf(PlayerId playerId) const {
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        if (entries_[i].playerId == playerId) {
            return i + 1;
        }
    }
    return std::nullopt;
}

const HallOfFameEntry* HallOfFame::Find(PlayerId playerId) const {
    for (const auto& entry : entries_) {
        if (entry.playerId == playerId) {
            return &entry;
        }
    }
    return nullptr;
}

}  // namespace lbx::game
