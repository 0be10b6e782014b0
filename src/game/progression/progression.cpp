/// @file progression.cpp
/// @brief ExperienceCurve and GrantExperience.

#include "lbx/game/progression.hpp"

#include <cmath>
#include <limits>
#include <string>

namespace lbx::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

namespace {

/// Levels past this are unreachable with int64 experience on any sane curve.
constexpr uint32_t kMaxLevel = 10'000;

} // namespace

int64_t ExperienceCurve::Threshold(uint32_t level) const noexcept {
    return static_cast<int64_t>(
        std::llround(base * std::pow(static_cast<double>(level), growth)));
}

uint32_t ExperienceCurve::LevelFor(int64_t experience) const noexcept {
    uint32_t level = 1;
    while (level < kMaxLevel && experience >= Threshold(level)) {
        ++level;
    }
    return level;
}

int64_t ExperienceForItem(const Item& item, double xpPerValue) noexcept {
    constexpr auto kMax = std::numeric_limits<int64_t>::max();
    const double xp = static_cast<double>(item.Value()) * xpPerValue;
    // 2^63 is the first double past int64 range.
    if (!(xp < 9223372036854775808.0)) {
        return xp > 0.0 ? kMax : 0;
    }
    return static_cast<int64_t>(std::llround(xp));
}

GameResult<LevelChange> GrantExperience(Progression& progression, int64_t amount,
                                        const ExperienceCurve& curve) {
    if (amount < 0) {
        return GameResult<LevelChange>::err(GameError(
            ErrorCode::InvalidArgument,
            "experience grant must not be negative, got " + std::to_string(amount)));
    }

    LevelChange change;
    change.fromLevel = progression.level;

    constexpr auto kMax = std::numeric_limits<int64_t>::max();
    progression.experience =
        amount > kMax - progression.experience ? kMax : progression.experience + amount;
    while (progression.level < kMaxLevel &&
           progression.experience >= curve.Threshold(progression.level)) {
        ++progression.level;
    }

    change.toLevel = progression.level;
    return GameResult<LevelChange>::ok(change);
}

}  // namespace lbx::game
