#pragma once

/// @file loot_config.hpp
/// @brief Typed loot-loop settings read from ConfigManager.

#include "lbx/foundation/config_manager.hpp"
#include "lbx/foundation/game_result.hpp"
#include "lbx/game/loot_pool.hpp"
#include "lbx/game/progression.hpp"
#include "lbx/game/rarity.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace lbx::game {

/// When LootGenerationSystem adds boxes.
enum class GenerationPolicy : uint8_t {
    Interval,  ///< `batchSize` boxes every `intervalSeconds`.
    Refill,    ///< Top the pool up to capacity every frame.
    Manual     ///< Only through LootBoxPlugin::GenerateBoxes().
};

[[nodiscard]] std::string_view generationPolicyName(GenerationPolicy p) noexcept;
[[nodiscard]] std::optional<GenerationPolicy> parseGenerationPolicy(std::string_view name) noexcept;

/// Settings of one loot-loop session.
///
/// YAML layout (all keys optional):
/// @code
///   random:     { seed: 42 }
///   pool:       { capacity: 5 }
///   generation: { policy: interval, interval_seconds: 2.0, batch_size: 1,
///                 distribution: skewed, templates_per_tier: 2 }
///   rarity:
///     weights:     { common: 60, ... }
///     multipliers: { common: 1.0, ... }
///   leveling:   { base: 100.0, growth: 1.5, xp_per_value: 1.0 }
/// @endcode
struct LootConfig {
    /// Upper bound for leveling.xp_per_value.
    static constexpr double kMaxXpPerValue = 1000.0;

    uint64_t seed = 0;  ///< 0 = seed from std::random_device.
    std::size_t poolCapacity = kDefaultPoolCapacity;

    GenerationPolicy policy = GenerationPolicy::Interval;
    double intervalSeconds = 2.0;
    std::size_t batchSize = 1;
    BoxDistribution distribution = BoxDistribution::Skewed;
    std::size_t templatesPerTier = kDefaultTemplatesPerTier;

    RarityProfile rarity;
    ExperienceCurve curve;
    double xpPerValue = 1.0;

    /// Read every known key, keeping defaults for absent ones.
    ///
    /// @return ConfigTypeMismatch for a key of the wrong type,
    ///         ConfigInvalidValue for an out-of-range or unknown value.
    [[nodiscard]] static foundation::GameResult<LootConfig> FromConfig(
        const foundation::ConfigManager& config);

    /// Check ranges of a hand-built config.  @return ConfigInvalidValue.
    [[nodiscard]] foundation::GameResult<void> Validate() const;
};

}  // namespace lbx::game
