#include <gtest/gtest.h>

#include <string>

#include "lbx/foundation/config_manager.hpp"
#include "lbx/game/loot_config.hpp"

using namespace lbx::game;
using lbx::foundation::ConfigManager;
using lbx::foundation::ErrorCode;

namespace {

lbx::foundation::GameResult<LootConfig> fromYaml(const std::string& yaml) {
    ConfigManager config;
    auto loaded = config.loadFromString(yaml);
    EXPECT_TRUE(loaded);
    return LootConfig::FromConfig(config);
}

} // namespace

TEST(LootConfigTest, EmptyConfigKeepsDefaults) {
    auto cfg = fromYaml("");
    ASSERT_TRUE(cfg);
    const auto& c = cfg.value();
    EXPECT_EQ(c.seed, 0u);
    EXPECT_EQ(c.poolCapacity, kDefaultPoolCapacity);
    EXPECT_EQ(c.policy, GenerationPolicy::Interval);
    EXPECT_DOUBLE_EQ(c.intervalSeconds, 2.0);
    EXPECT_EQ(c.batchSize, 1u);
    EXPECT_EQ(c.distribution, BoxDistribution::Skewed);
    EXPECT_EQ(c.templatesPerTier, kDefaultTemplatesPerTier);
    EXPECT_DOUBLE_EQ(c.curve.base, 100.0);
    EXPECT_DOUBLE_EQ(c.curve.growth, 1.5);
    EXPECT_DOUBLE_EQ(c.xpPerValue, 1.0);
    EXPECT_DOUBLE_EQ(c.rarity.Traits(Rarity::Epic).weight, 4.0);
}

TEST(LootConfigTest, ReadsEveryKey) {
    auto cfg = fromYaml(
        "random:\n  seed: 42\n"
        "pool:\n  capacity: 8\n"
        "generation:\n"
        "  policy: refill\n"
        "  interval_seconds: 0.5\n"
        "  batch_size: 3\n"
        "  distribution: mixed\n"
        "  templates_per_tier: 1\n"
        "rarity:\n"
        "  weights: { legendary: 5 }\n"
        "  multipliers: { common: 2.0 }\n"
        "leveling:\n  base: 50.0\n  growth: 2.0\n  xp_per_value: 0.5\n");
    ASSERT_TRUE(cfg);
    const auto& c = cfg.value();
    EXPECT_EQ(c.seed, 42u);
    EXPECT_EQ(c.poolCapacity, 8u);
    EXPECT_EQ(c.policy, GenerationPolicy::Refill);
    EXPECT_DOUBLE_EQ(c.intervalSeconds, 0.5);
    EXPECT_EQ(c.batchSize, 3u);
    EXPECT_EQ(c.distribution, BoxDistribution::Mixed);
    EXPECT_EQ(c.templatesPerTier, 1u);
    EXPECT_DOUBLE_EQ(c.rarity.Traits(Rarity::Legendary).weight, 5.0);
    EXPECT_DOUBLE_EQ(c.rarity.Traits(Rarity::Common).weight, 60.0);
    EXPECT_DOUBLE_EQ(c.rarity.Traits(Rarity::Common).valueMultiplier, 2.0);
    EXPECT_DOUBLE_EQ(c.curve.base, 50.0);
    EXPECT_DOUBLE_EQ(c.curve.growth, 2.0);
    EXPECT_DOUBLE_EQ(c.xpPerValue, 0.5);
}

TEST(LootConfigTest, UnknownPolicyIsInvalid) {
    auto cfg = fromYaml("generation:\n  policy: sometimes\n");
    ASSERT_FALSE(cfg);
    EXPECT_EQ(cfg.error().code(), ErrorCode::ConfigInvalidValue);
}

TEST(LootConfigTest, UnknownDistributionIsInvalid) {
    auto cfg = fromYaml("generation:\n  distribution: bell\n");
    ASSERT_FALSE(cfg);
    EXPECT_EQ(cfg.error().code(), ErrorCode::ConfigInvalidValue);
}

TEST(LootConfigTest, NonPositiveCapacityIsInvalid) {
    auto zero = fromYaml("pool:\n  capacity: 0\n");
    ASSERT_FALSE(zero);
    EXPECT_EQ(zero.error().code(), ErrorCode::ConfigInvalidValue);

    auto negative = fromYaml("pool:\n  capacity: -2\n");
    ASSERT_FALSE(negative);
    EXPECT_EQ(negative.error().code(), ErrorCode::ConfigInvalidValue);
}

TEST(LootConfigTest, NonPositiveWeightIsInvalid) {
    auto cfg = fromYaml("rarity:\n  weights:\n    rare: 0\n");
    ASSERT_FALSE(cfg);
    EXPECT_EQ(cfg.error().code(), ErrorCode::ConfigInvalidValue);
}

TEST(LootConfigTest, NonPositiveMultiplierIsInvalid) {
    auto cfg = fromYaml("rarity:\n  multipliers:\n    epic: -5\n");
    ASSERT_FALSE(cfg);
    EXPECT_EQ(cfg.error().code(), ErrorCode::ConfigInvalidValue);
}

TEST(LootConfigTest, NegativeIntervalIsInvalid) {
    auto cfg = fromYaml("generation:\n  interval_seconds: -1.0\n");
    ASSERT_FALSE(cfg);
    EXPECT_EQ(cfg.error().code(), ErrorCode::ConfigInvalidValue);
}

TEST(LootConfigTest, NonPositiveGrowthIsInvalid) {
    auto cfg = fromYaml("leveling:\n  growth: 0\n");
    ASSERT_FALSE(cfg);
    EXPECT_EQ(cfg.error().code(), ErrorCode::ConfigInvalidValue);
}

TEST(LootConfigTest, WrongTypeIsTypeMismatch) {
    auto cfg = fromYaml("leveling:\n  base: lots\n");
    ASSERT_FALSE(cfg);
    EXPECT_EQ(cfg.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST(LootConfigTest, LateWrongTypeIsTypeMismatch) {
    auto cfg = fromYaml("pool:\n  capacity: 4\nleveling:\n  xp_per_value: [1, 2]\n");
    ASSERT_FALSE(cfg);
    EXPECT_EQ(cfg.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST(LootConfigTest, XpPerValueIsBounded) {
    auto atLimit = fromYaml("leveling:\n  xp_per_value: 1000\n");
    ASSERT_TRUE(atLimit);
    EXPECT_DOUBLE_EQ(atLimit.value().xpPerValue, LootConfig::kMaxXpPerValue);

    auto huge = fromYaml("leveling:\n  xp_per_value: 1.0e300\n");
    ASSERT_FALSE(huge);
    EXPECT_EQ(huge.error().code(), ErrorCode::ConfigInvalidValue);
}

TEST(LootConfigTest, ValidateHandBuiltConfig) {
    LootConfig cfg;
    EXPECT_TRUE(cfg.Validate());

    cfg.batchSize = 0;
    auto bad = cfg.Validate();
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code(), ErrorCode::ConfigInvalidValue);
}

TEST(LootConfigTest, EnumNamesRoundTrip) {
    EXPECT_EQ(parseGenerationPolicy(generationPolicyName(GenerationPolicy::Manual)),
              GenerationPolicy::Manual);
    EXPECT_EQ(parseBoxDistribution(boxDistributionName(BoxDistribution::Uniform)),
              BoxDistribution::Uniform);
    EXPECT_FALSE(parseGenerationPolicy("never").has_value());
}
