#include <gtest/gtest.h>

#include <set>
#include <string>

#include "lbx/game/item_catalog.hpp"
#include "lbx/game/loot_pool.hpp"
#include "lbx/game/random_source.hpp"

using namespace lbx::game;
using lbx::foundation::BoxId;
using lbx::foundation::ErrorCode;
using lbx::foundation::ItemInstanceId;

namespace {

ItemTemplate makeTemplate(uint32_t id, Rarity rarity, int64_t value) {
    return ItemTemplate{id, "template-" + std::to_string(id), ItemKind::Trinket, rarity, value, {}};
}

/// Box with a single Common candidate worth @p value.
LootBox commonBox(BoxId id, int64_t value = 10) {
    LootBox box;
    box.id = id;
    box.candidates[rarityIndex(Rarity::Common)].push_back(
        makeTemplate(1001, Rarity::Common, value));
    (void)box.table.SetWeight(Rarity::Common, 1.0);
    return box;
}

} // namespace

// ===========================================================================
// ItemCatalog
// ===========================================================================

TEST(ItemCatalogTest, BuiltinHasThreeTemplatesPerTier) {
    auto catalog = ItemCatalog::Builtin();
    EXPECT_EQ(catalog.Size(), 15u);
    for (auto r : kAllRarities) {
        EXPECT_EQ(catalog.TemplatesOf(r).size(), 3u) << rarityName(r);
        for (const auto* tmpl : catalog.TemplatesOf(r)) {
            EXPECT_EQ(tmpl->rarity, r);
        }
    }

    const auto* sword = catalog.GetTemplate(1001);
    ASSERT_NE(sword, nullptr);
    EXPECT_EQ(sword->name, "Rusty Sword");
    EXPECT_EQ(sword->baseValue, 10);
}

TEST(ItemCatalogTest, RegisterRejectsBadTemplates) {
    ItemCatalog catalog;
    EXPECT_EQ(catalog.RegisterTemplate(makeTemplate(0, Rarity::Rare, 5)).error().code(),
              ErrorCode::InvalidArgument);
    EXPECT_EQ(catalog.RegisterTemplate(makeTemplate(7, Rarity::Rare, -1)).error().code(),
              ErrorCode::InvalidArgument);

    ASSERT_TRUE(catalog.RegisterTemplate(makeTemplate(7, Rarity::Rare, 5)));
    EXPECT_EQ(catalog.RegisterTemplate(makeTemplate(7, Rarity::Epic, 9)).error().code(),
              ErrorCode::AlreadyExists);
    EXPECT_EQ(catalog.Size(), 1u);
    EXPECT_EQ(catalog.GetTemplate(7)->rarity, Rarity::Rare);
    EXPECT_EQ(catalog.GetTemplate(8), nullptr);
}

TEST(ItemCatalogTest, MoveKeepsTierIndex) {
    ItemCatalog source;
    ASSERT_TRUE(source.RegisterTemplate(makeTemplate(3, Rarity::Epic, 50)));
    ItemCatalog moved(std::move(source));

    ASSERT_EQ(moved.TemplatesOf(Rarity::Epic).size(), 1u);
    EXPECT_EQ(moved.TemplatesOf(Rarity::Epic).front(), moved.GetTemplate(3));
}

// ===========================================================================
// Item
// ===========================================================================

TEST(ItemTest, ValueIsBaseTimesMultiplierRounded) {
    auto tmpl = makeTemplate(2001, Rarity::Uncommon, 15);
    Item item(ItemInstanceId(1), tmpl, 1.5);
    EXPECT_EQ(item.Value(), 23);  // 22.5 rounds half away from zero
    EXPECT_EQ(item.TemplateId(), 2001u);
    EXPECT_EQ(item.GetRarity(), Rarity::Uncommon);
}

// ===========================================================================
// LootBoxPool
// ===========================================================================

TEST(LootBoxPoolTest, InsertFindExtract) {
    LootBoxPool pool(3);
    auto id = pool.Insert(commonBox(pool.AllocateBoxId()));
    ASSERT_TRUE(id);
    EXPECT_TRUE(pool.Contains(id.value()));
    ASSERT_NE(pool.Find(id.value()), nullptr);

    auto box = pool.Extract(id.value());
    ASSERT_TRUE(box.has_value());
    EXPECT_EQ(box->id, id.value());
    EXPECT_TRUE(pool.Empty());

    // A box is removed exactly once.
    EXPECT_FALSE(pool.Extract(id.value()).has_value());
    EXPECT_EQ(pool.ExtractedCount(), 1u);
}

TEST(LootBoxPoolTest, InsertWhenFullIsPoolAtCapacity) {
    LootBoxPool pool(2);
    ASSERT_TRUE(pool.Insert(commonBox(pool.AllocateBoxId())));
    ASSERT_TRUE(pool.Insert(commonBox(pool.AllocateBoxId())));
    EXPECT_TRUE(pool.IsFull());
    EXPECT_EQ(pool.FreeSlots(), 0u);

    auto rejected = pool.Insert(commonBox(pool.AllocateBoxId()));
    ASSERT_FALSE(rejected);
    EXPECT_EQ(rejected.error().code(), ErrorCode::PoolAtCapacity);
    EXPECT_TRUE(rejected.error().isInformational());
    EXPECT_EQ(pool.Size(), 2u);
}

TEST(LootBoxPoolTest, InsertValidatesBox) {
    LootBoxPool pool;
    EXPECT_EQ(pool.Insert(commonBox(BoxId())).error().code(), ErrorCode::InvalidArgument);

    LootBox noTiers;
    noTiers.id = BoxId(4);
    EXPECT_EQ(pool.Insert(noTiers).error().code(), ErrorCode::InvalidArgument);

    LootBox missingCandidates = commonBox(BoxId(5));
    (void)missingCandidates.table.SetWeight(Rarity::Legendary, 1.0);
    EXPECT_EQ(pool.Insert(missingCandidates).error().code(), ErrorCode::InvalidArgument);

    ASSERT_TRUE(pool.Insert(commonBox(BoxId(6))));
    EXPECT_EQ(pool.Insert(commonBox(BoxId(6))).error().code(), ErrorCode::AlreadyExists);
    EXPECT_EQ(pool.Size(), 1u);
}

TEST(LootBoxPoolTest, IdsAreMonotonicAndNeverReused) {
    LootBoxPool pool;
    ASSERT_TRUE(pool.Insert(commonBox(BoxId(10))));
    EXPECT_EQ(pool.AllocateBoxId(), BoxId(11));

    (void)pool.Extract(BoxId(10));
    EXPECT_EQ(pool.AllocateBoxId(), BoxId(12));

    EXPECT_EQ(pool.AllocateItemId(), ItemInstanceId(1));
    EXPECT_EQ(pool.AllocateItemId(), ItemInstanceId(2));
}

TEST(LootBoxPoolTest, FirstIdIsLowest) {
    LootBoxPool pool;
    EXPECT_FALSE(pool.FirstId().has_value());
    ASSERT_TRUE(pool.Insert(commonBox(BoxId(8))));
    ASSERT_TRUE(pool.Insert(commonBox(BoxId(3))));
    EXPECT_EQ(pool.FirstId(), BoxId(3));
}

// ===========================================================================
// Generation
// ===========================================================================

TEST(LootGenerationTest, SkewedBoxFollowsBaseTable) {
    auto catalog = ItemCatalog::Builtin();
    RandomSource rng(5);
    RarityTable base = RarityTable::Default();
    base.Exclude(Rarity::Legendary);

    auto box = GenerateLootBox(BoxId(1), catalog, BoxDistribution::Skewed, 2, base, rng);
    ASSERT_TRUE(box);
    EXPECT_EQ(box.value().distribution, BoxDistribution::Skewed);
    EXPECT_FALSE(box.value().table.Contains(Rarity::Legendary));
    EXPECT_DOUBLE_EQ(box.value().table.Weight(Rarity::Common), 60.0);

    for (auto r : kAllRarities) {
        const auto& candidates = box.value().CandidatesOf(r);
        if (r == Rarity::Legendary) {
            EXPECT_TRUE(candidates.empty());
            continue;
        }
        ASSERT_EQ(candidates.size(), 2u);
        EXPECT_NE(candidates[0].id, candidates[1].id);
        EXPECT_EQ(candidates[0].rarity, r);
    }
    EXPECT_EQ(box.value().CandidateCount(), 8u);
}

TEST(LootGenerationTest, UniformBoxWeightsEveryCatalogTierEqually) {
    auto catalog = ItemCatalog::Builtin();
    RandomSource rng(5);
    auto box = GenerateLootBox(BoxId(1), catalog, BoxDistribution::Uniform, 1,
                               RarityTable::Default(), rng);
    ASSERT_TRUE(box);
    for (auto r : kAllRarities) {
        EXPECT_DOUBLE_EQ(box.value().table.Weight(r), 1.0);
        EXPECT_EQ(box.value().CandidatesOf(r).size(), 1u);
    }
}

TEST(LootGenerationTest, MixedResolvesToConcreteDistribution) {
    auto catalog = ItemCatalog::Builtin();
    RandomSource rng(17);
    std::set<BoxDistribution> seen;
    for (uint64_t i = 1; i <= 64; ++i) {
        auto box = GenerateLootBox(BoxId(i), catalog, BoxDistribution::Mixed, 1,
                                   RarityTable::Default(), rng);
        ASSERT_TRUE(box);
        EXPECT_NE(box.value().distribution, BoxDistribution::Mixed);
        seen.insert(box.value().distribution);
    }
    EXPECT_EQ(seen.size(), 2u);
}

TEST(LootGenerationTest, EmptyCatalogIsCatalogEmpty) {
    ItemCatalog empty;
    RandomSource rng(1);
    auto box = GenerateLootBox(BoxId(1), empty, BoxDistribution::Skewed, 2,
                               RarityTable::Default(), rng);
    ASSERT_FALSE(box);
    EXPECT_EQ(box.error().code(), ErrorCode::CatalogEmpty);
}

TEST(LootGenerationTest, NoMatchingTierIsCatalogEmpty) {
    ItemCatalog catalog;
    ASSERT_TRUE(catalog.RegisterTemplate(makeTemplate(1, Rarity::Epic, 50)));
    RarityTable commonOnly;
    ASSERT_TRUE(commonOnly.SetWeight(Rarity::Common, 1.0));
    RandomSource rng(1);

    auto box = GenerateLootBox(BoxId(1), catalog, BoxDistribution::Skewed, 2, commonOnly, rng);
    ASSERT_FALSE(box);
    EXPECT_EQ(box.error().code(), ErrorCode::CatalogEmpty);
}

TEST(LootGenerationTest, ZeroTemplatesPerTierIsInvalid) {
    auto catalog = ItemCatalog::Builtin();
    RandomSource rng(1);
    auto box = GenerateLootBox(BoxId(1), catalog, BoxDistribution::Skewed, 0,
                               RarityTable::Default(), rng);
    ASSERT_FALSE(box);
    EXPECT_EQ(box.error().code(), ErrorCode::InvalidArgument);
}

TEST(LootGenerationTest, CapacityFiveThenSixthGenerationIsNoop) {
    auto catalog = ItemCatalog::Builtin();
    LootBoxPool pool(5);
    RandomSource rng(42);
    const auto base = RarityTable::Default();

    for (int i = 0; i < 5; ++i) {
        auto made = GenerateBoxes(pool, 1, catalog, BoxDistribution::Skewed, 2, base, rng);
        ASSERT_TRUE(made);
        EXPECT_EQ(made.value(), 1u);
    }
    EXPECT_EQ(pool.Size(), 5u);

    auto sixth = GenerateBoxes(pool, 1, catalog, BoxDistribution::Skewed, 2, base, rng);
    ASSERT_FALSE(sixth);
    EXPECT_EQ(sixth.error().code(), ErrorCode::PoolAtCapacity);
    EXPECT_EQ(pool.Size(), 5u);
    EXPECT_EQ(pool.InsertedCount(), 5u);
}

TEST(LootGenerationTest, BatchStopsAtCapacity) {
    auto catalog = ItemCatalog::Builtin();
    LootBoxPool pool(3);
    RandomSource rng(42);

    auto made = GenerateBoxes(pool, 10, catalog, BoxDistribution::Uniform, 2,
                              RarityTable::Default(), rng);
    ASSERT_TRUE(made);
    EXPECT_EQ(made.value(), 3u);
    EXPECT_TRUE(pool.IsFull());
}

TEST(LootGenerationTest, ZeroCountOnFullPoolIsNotAnError) {
    auto catalog = ItemCatalog::Builtin();
    LootBoxPool pool(1);
    RandomSource rng(42);
    ASSERT_TRUE(GenerateBoxes(pool, 1, catalog, BoxDistribution::Skewed, 1,
                              RarityTable::Default(), rng));

    auto none = GenerateBoxes(pool, 0, catalog, BoxDistribution::Skewed, 1,
                              RarityTable::Default(), rng);
    ASSERT_TRUE(none);
    EXPECT_EQ(none.value(), 0u);
}
