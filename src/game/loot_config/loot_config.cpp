/// @file loot_config.cpp
/// @brief LootConfig parsing and validation.

#include "lbx/game/loot_config.hpp"

#include <string>
#include <utility>

namespace lbx::game {

using foundation::ConfigManager;
using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

std::string_view generationPolicyName(GenerationPolicy p) noexcept {
    switch (p) {
        case GenerationPolicy::Interval: return "interval";
        case GenerationPolicy::Refill:   return "refill";
        case GenerationPolicy::Manual:   return "manual";
    }
    return "unknown";
}

std::optional<GenerationPolicy> parseGenerationPolicy(std::string_view name) noexcept {
    for (auto p : {GenerationPolicy::Interval, GenerationPolicy::Refill, GenerationPolicy::Manual}) {
        if (generationPolicyName(p) == name) {
            return p;
        }
    }
    return std::nullopt;
}

namespace {

GameError invalid(std::string_view key, const std::string& detail) {
    return GameError(ErrorCode::ConfigInvalidValue,
                     "invalid value for " + std::string(key) + ": " + detail);
}

/// Read a positive count stored as a signed YAML integer.
GameResult<std::size_t> readCount(const ConfigManager& config, std::string_view key,
                                  std::size_t fallback) {
    auto raw = config.getOr<int64_t>(key, static_cast<int64_t>(fallback));
    if (!raw) {
        return GameResult<std::size_t>::err(raw.error());
    }
    if (raw.value() <= 0) {
        return GameResult<std::size_t>::err(
            invalid(key, "must be positive, got " + std::to_string(raw.value())));
    }
    return GameResult<std::size_t>::ok(static_cast<std::size_t>(raw.value()));
}

/// Move a successful read into @p target; otherwise keep its error.
template <typename T, typename U>
[[nodiscard]] bool take(GameResult<T> read, U& target, GameError& error) {
    if (!read) {
        error = read.error();
        return false;
    }
    target = std::move(read).value();
    return true;
}

} // namespace

GameResult<LootConfig> LootConfig::FromConfig(const ConfigManager& config) {
    LootConfig out;
    GameError error;

    std::string policyName;
    std::string distributionName;
    if (!take(config.getOr<uint64_t>("random.seed", out.seed), out.seed, error) ||
        !take(readCount(config, "pool.capacity", out.poolCapacity), out.poolCapacity, error) ||
        !take(config.getOr<std::string>("generation.policy",
                                        std::string(generationPolicyName(out.policy))),
              policyName, error) ||
        !take(config.getOr<double>("generation.interval_seconds", out.intervalSeconds),
              out.intervalSeconds, error) ||
        !take(readCount(config, "generation.batch_size", out.batchSize), out.batchSize,
              error) ||
        !take(config.getOr<std::string>("generation.distribution",
                                        std::string(boxDistributionName(out.distribution))),
              distributionName, error) ||
        !take(readCount(config, "generation.templates_per_tier", out.templatesPerTier),
              out.templatesPerTier, error)) {
        return GameResult<LootConfig>::err(error);
    }

    if (auto policy = parseGenerationPolicy(policyName)) {
        out.policy = *policy;
    } else {
        return GameResult<LootConfig>::err(
            invalid("generation.policy", "unknown policy '" + policyName + "'"));
    }
    if (auto distribution = parseBoxDistribution(distributionName)) {
        out.distribution = *distribution;
    } else {
        return GameResult<LootConfig>::err(invalid(
            "generation.distribution", "unknown distribution '" + distributionName + "'"));
    }

    for (auto r : kAllRarities) {
        const std::string tier(rarityKey(r));
        const auto& traits = out.rarity.Traits(r);

        double weight = traits.weight;
        double multiplier = traits.valueMultiplier;
        if (!take(config.getOr<double>("rarity.weights." + tier, weight), weight, error) ||
            !take(config.getOr<double>("rarity.multipliers." + tier, multiplier), multiplier,
                  error)) {
            return GameResult<LootConfig>::err(error);
        }
        if (auto set = out.rarity.SetWeight(r, weight); !set) {
            return GameResult<LootConfig>::err(
                invalid("rarity.weights." + tier, std::string(set.error().message())));
        }
        if (auto set = out.rarity.SetValueMultiplier(r, multiplier); !set) {
            return GameResult<LootConfig>::err(
                invalid("rarity.multipliers." + tier, std::string(set.error().message())));
        }
    }

    if (!take(config.getOr<double>("leveling.base", out.curve.base), out.curve.base, error) ||
        !take(config.getOr<double>("leveling.growth", out.curve.growth), out.curve.growth,
              error) ||
        !take(config.getOr<double>("leveling.xp_per_value", out.xpPerValue), out.xpPerValue,
              error)) {
        return GameResult<LootConfig>::err(error);
    }

    if (auto valid = out.Validate(); !valid) {
        return GameResult<LootConfig>::err(valid.error());
    }
    return GameResult<LootConfig>::ok(std::move(out));
}

GameResult<void> LootConfig::Validate() const {
    if (poolCapacity == 0) {
        return GameResult<void>::err(invalid("pool.capacity", "must be positive"));
    }
    if (!(intervalSeconds >= 0.0)) {
        return GameResult<void>::err(invalid("generation.interval_seconds",
                                             "must not be negative, got " +
                                                 std::to_string(intervalSeconds)));
    }
    if (batchSize == 0) {
        return GameResult<void>::err(invalid("generation.batch_size", "must be positive"));
    }
    if (templatesPerTier == 0) {
        return GameResult<void>::err(
            invalid("generation.templates_per_tier", "must be positive"));
    }
    if (!(curve.base > 0.0)) {
        return GameResult<void>::err(
            invalid("leveling.base", "must be positive, got " + std::to_string(curve.base)));
    }
    if (!(curve.growth > 0.0)) {
        return GameResult<void>::err(invalid(
            "leveling.growth", "must be positive, got " + std::to_string(curve.growth)));
    }
    if (!(xpPerValue >= 0.0 && xpPerValue <= kMaxXpPerValue)) {
        return GameResult<void>::err(invalid(
            "leveling.xp_per_value", "must be within [0, " + std::to_string(kMaxXpPerValue) +
                                         "], got " + std::to_string(xpPerValue)));
    }
    for (auto r : kAllRarities) {
        const auto& traits = rarity.Traits(r);
        if (!(traits.weight > 0.0) || !(traits.valueMultiplier > 0.0)) {
            return GameResult<void>::err(
                invalid("rarity", std::string(rarityName(r)) + " traits must be positive"));
        }
    }
    return GameResult<void>::ok();
}

}  // namespace lbx::game
