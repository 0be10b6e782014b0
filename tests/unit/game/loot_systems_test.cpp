/// @file loot_systems_test.cpp
/// @brief Unit tests for the loot, equipment, leveling and hall-of-fame systems.

#include <gtest/gtest.h>

#include <optional>
#include <string>

#include "lbx/ecs/component_storage.hpp"
#include "lbx/ecs/entity_manager.hpp"
#include "lbx/game/box_choice_system.hpp"
#include "lbx/game/box_opening_system.hpp"
#include "lbx/game/equipment_systems.hpp"
#include "lbx/game/hall_of_fame_system.hpp"
#include "lbx/game/leveling_system.hpp"
#include "lbx/game/loot_generation_system.hpp"

using namespace lbx::game;
using lbx::ecs::ComponentStorage;
using lbx::ecs::Entity;
using lbx::ecs::EntityManager;
using lbx::foundation::BoxId;
using lbx::foundation::ErrorCode;
using lbx::foundation::ItemInstanceId;
using lbx::foundation::PlayerId;

namespace {

class LootSystemsTest : public ::testing::Test {
protected:
    Entity addPlayer(uint64_t id, const std::string& name) {
        auto e = entities.Create();
        profiles.Add(e, PlayerProfile{PlayerId(id), name});
        inventories.Add(e);
        equipment.Add(e);
        wallets.Add(e);
        progressions.Add(e);
        return e;
    }

    /// Put an item worth @p value (multiplier 1) straight into @p player's inventory.
    ItemInstanceId giveItem(Entity player, uint64_t id, int64_t value) {
        ItemTemplate tmpl{1001, "item-" + std::to_string(id), ItemKind::Weapon, Rarity::Common,
                          value, {}};
        const ItemInstanceId itemId(id);
        inventories.Get(player).items.emplace(itemId, Item(itemId, tmpl, 1.0));
        return itemId;
    }

    Entity requestOpen(Entity player, BoxSelection selection) {
        auto e = entities.Create();
        openRequests.Add(e, OpenBoxRequest{player, selection, std::nullopt});
        return e;
    }

    void acquire(Entity player, int64_t value) {
        ItemTemplate tmpl{1001, "loot", ItemKind::Trinket, Rarity::Common, value, {}};
        auto e = entities.Create();
        acquired.Add(e, ItemAcquiredEvent{player, Item(ItemInstanceId(value), tmpl, 1.0)});
    }

    void fillPool(std::size_t count) {
        ASSERT_TRUE(GenerateBoxes(pool, count, ItemCatalog::Builtin(), BoxDistribution::Skewed,
                                  2, RarityTable::Default(), rng));
    }

    std::size_t countNotices(NotificationKind kind) const {
        std::size_t n = 0;
        for (const auto& notice : feed.Pending()) {
            n += notice.kind == kind ? 1 : 0;
        }
        return n;
    }

    EntityManager entities;
    ComponentStorage<PlayerProfile> profiles;
    ComponentStorage<Inventory> inventories;
    ComponentStorage<Equipment> equipment;
    ComponentStorage<Wallet> wallets;
    ComponentStorage<Progression> progressions;
    ComponentStorage<OpenBoxRequest> openRequests;
    ComponentStorage<EquipRequest> equipRequests;
    ComponentStorage<SellRequest> sellRequests;
    ComponentStorage<ItemAcquiredEvent> acquired;
    ComponentStorage<LevelUpEvent> levelUps;

    LootBoxPool pool{5};
    RandomSource rng{7};
    LootFeed feed;
    HallOfFame hallOfFame;
    LootConfig config;
    ExperienceCurve curve;
};

}  // namespace

// ===========================================================================
// LootGenerationSystem
// ===========================================================================

TEST_F(LootSystemsTest, ManualPolicyNeverGenerates) {
    config.policy = GenerationPolicy::Manual;
    LootGenerationSystem system(pool, ItemCatalog::Builtin(), rng, feed, config);

    for (int i = 0; i < 10; ++i) {
        system.Execute(5.0f);
    }
    EXPECT_TRUE(pool.Empty());
    EXPECT_EQ(feed.Size(), 0u);
}

TEST_F(LootSystemsTest, RefillPolicyFillsPoolInOneFrame) {
    config.policy = GenerationPolicy::Refill;
    LootGenerationSystem system(pool, ItemCatalog::Builtin(), rng, feed, config);

    system.Execute(0.0f);
    EXPECT_TRUE(pool.IsFull());
    ASSERT_EQ(feed.Size(), 1u);
    EXPECT_EQ(feed.Pending()[0].kind, NotificationKind::BoxGenerated);
    EXPECT_FALSE(feed.Pending()[0].player.isValid());

    // Full pool: nothing more, and no extra notice.
    system.Execute(0.0f);
    EXPECT_EQ(pool.Size(), 5u);
    EXPECT_EQ(feed.Size(), 1u);
}

TEST_F(LootSystemsTest, IntervalPolicyWaitsForInterval) {
    config.policy = GenerationPolicy::Interval;
    config.intervalSeconds = 2.0;
    config.batchSize = 1;
    LootGenerationSystem system(pool, ItemCatalog::Builtin(), rng, feed, config);

    for (int i = 0; i < 3; ++i) {
        system.Execute(0.5f);
    }
    EXPECT_TRUE(pool.Empty());
    EXPECT_FLOAT_EQ(system.Elapsed(), 1.5f);

    system.Execute(0.5f);
    EXPECT_EQ(pool.Size(), 1u);
    EXPECT_FLOAT_EQ(system.Elapsed(), 0.0f);
}

TEST_F(LootSystemsTest, IntervalPolicyStopsAtCapacity) {
    config.policy = GenerationPolicy::Interval;
    config.intervalSeconds = 0.0;
    config.batchSize = 2;
    LootGenerationSystem system(pool, ItemCatalog::Builtin(), rng, feed, config);

    for (int i = 0; i < 6; ++i) {
        system.Execute(0.1f);
    }
    EXPECT_EQ(pool.Size(), pool.Capacity());
    EXPECT_EQ(pool.InsertedCount(), 5u);
    EXPECT_EQ(countNotices(NotificationKind::ActionFailed), 0u);
}

// ===========================================================================
// BoxChoiceSystem
// ===========================================================================

TEST_F(LootSystemsTest, SimultaneousAutoRequestsClaimDistinctBoxes) {
    fillPool(2);
    auto ada = addPlayer(1, "ada");
    auto bo = addPlayer(2, "bo");
    auto r1 = requestOpen(ada, BoxSelection::AutoFirst());
    auto r2 = requestOpen(bo, BoxSelection::AutoFirst());

    BoxChoiceSystem system(openRequests, pool, profiles, feed);
    system.Execute(0.0f);

    const auto& first = openRequests.Get(r1);
    const auto& second = openRequests.Get(r2);
    ASSERT_TRUE(first.chosen.has_value());
    ASSERT_TRUE(second.chosen.has_value());
    EXPECT_NE(*first.chosen, *second.chosen);
    EXPECT_EQ(*first.chosen, pool.FirstId().value());
    EXPECT_FALSE(first.processed);
    EXPECT_FALSE(second.processed);
}

TEST_F(LootSystemsTest, AutoRequestWithoutFreeBoxFails) {
    fillPool(1);
    auto ada = addPlayer(1, "ada");
    (void)requestOpen(ada, BoxSelection::AutoFirst());
    auto late = requestOpen(ada, BoxSelection::AutoFirst());

    BoxChoiceSystem system(openRequests, pool, profiles, feed);
    system.Execute(0.0f);

    EXPECT_TRUE(openRequests.Get(late).processed);
    EXPECT_FALSE(openRequests.Get(late).chosen.has_value());
    ASSERT_EQ(countNotices(NotificationKind::ActionFailed), 1u);
    EXPECT_EQ(feed.Pending()[0].code, ErrorCode::PoolEmpty);
    EXPECT_EQ(feed.Pending()[0].player, PlayerId(1));
}

TEST_F(LootSystemsTest, ExplicitMissingBoxIsReported) {
    fillPool(1);
    auto ada = addPlayer(1, "ada");
    auto request = requestOpen(ada, BoxSelection::Explicit(BoxId(999)));

    BoxChoiceSystem system(openRequests, pool, profiles, feed);
    system.Execute(0.0f);

    EXPECT_TRUE(openRequests.Get(request).processed);
    ASSERT_EQ(feed.Size(), 1u);
    EXPECT_EQ(feed.Pending()[0].code, ErrorCode::BoxNotFound);
    EXPECT_EQ(pool.Size(), 1u);
}

// ===========================================================================
// BoxOpeningSystem
// ===========================================================================

TEST_F(LootSystemsTest, OpeningMovesItemAndSpawnsEvent) {
    fillPool(1);
    const auto boxId = pool.FirstId().value();
    auto ada = addPlayer(1, "ada");
    auto request = requestOpen(ada, BoxSelection::Explicit(boxId));
    openRequests.Get(request).chosen = boxId;

    BoxOpeningSystem system(openRequests, inventories, profiles, acquired, entities, pool, rng,
                            feed);
    system.Execute(0.0f);

    EXPECT_TRUE(openRequests.Get(request).processed);
    EXPECT_TRUE(pool.Empty());
    ASSERT_EQ(inventories.Get(ada).Size(), 1u);
    ASSERT_EQ(acquired.Size(), 1u);

    const auto& event = *acquired.begin();
    EXPECT_EQ(event.player, ada);
    EXPECT_TRUE(inventories.Get(ada).Contains(event.item.InstanceId()));
    EXPECT_EQ(countNotices(NotificationKind::BoxOpened), 1u);
}

TEST_F(LootSystemsTest, OpeningVanishedBoxFails) {
    auto ada = addPlayer(1, "ada");
    auto request = requestOpen(ada, BoxSelection::Explicit(BoxId(3)));
    openRequests.Get(request).chosen = BoxId(3);

    BoxOpeningSystem system(openRequests, inventories, profiles, acquired, entities, pool, rng,
                            feed);
    system.Execute(0.0f);

    EXPECT_TRUE(openRequests.Get(request).processed);
    EXPECT_EQ(acquired.Size(), 0u);
    EXPECT_EQ(inventories.Get(ada).Size(), 0u);
    ASSERT_EQ(feed.Size(), 1u);
    EXPECT_EQ(feed.Pending()[0].code, ErrorCode::BoxNotFound);
}

TEST_F(LootSystemsTest, OpeningSkipsUnchosenRequests) {
    fillPool(1);
    auto ada = addPlayer(1, "ada");
    auto request = requestOpen(ada, BoxSelection::AutoFirst());

    BoxOpeningSystem system(openRequests, inventories, profiles, acquired, entities, pool, rng,
                            feed);
    system.Execute(0.0f);

    EXPECT_FALSE(openRequests.Get(request).processed);
    EXPECT_EQ(pool.Size(), 1u);
}

// ===========================================================================
// EquipSystem / SellSystem
// ===========================================================================

TEST_F(LootSystemsTest, EquipRequestEquipsOwnedItem) {
    auto ada = addPlayer(1, "ada");
    auto item = giveItem(ada, 1, 10);
    auto request = entities.Create();
    equipRequests.Add(request, EquipRequest{ada, item});

    EquipSystem system(equipRequests, inventories, equipment, profiles, feed);
    system.Execute(0.0f);

    EXPECT_TRUE(equipRequests.Get(request).processed);
    EXPECT_TRUE(equipment.Get(ada).IsEquipped(item));
    EXPECT_EQ(wallets.Get(ada).currency, 0);
    EXPECT_EQ(countNotices(NotificationKind::ItemEquipped), 1u);
}

TEST_F(LootSystemsTest, EquipRequestForUnownedItemFails) {
    auto ada = addPlayer(1, "ada");
    auto owned = giveItem(ada, 1, 10);
    equipment.Get(ada).equipped = owned;

    auto request = entities.Create();
    equipRequests.Add(request, EquipRequest{ada, ItemInstanceId(77)});

    EquipSystem system(equipRequests, inventories, equipment, profiles, feed);
    system.Execute(0.0f);

    EXPECT_TRUE(equipment.Get(ada).IsEquipped(owned));
    ASSERT_EQ(feed.Size(), 1u);
    EXPECT_EQ(feed.Pending()[0].code, ErrorCode::ItemNotInInventory);
}

TEST_F(LootSystemsTest, EquipThenSellInSameFrameEndsSold) {
    auto ada = addPlayer(1, "ada");
    auto item = giveItem(ada, 1, 25);

    equipRequests.Add(entities.Create(), EquipRequest{ada, item});
    sellRequests.Add(entities.Create(), SellRequest{ada, item});

    EquipSystem equip(equipRequests, inventories, equipment, profiles, feed);
    SellSystem sell(sellRequests, inventories, equipment, wallets, profiles, feed);
    equip.Execute(0.0f);
    sell.Execute(0.0f);

    EXPECT_FALSE(inventories.Get(ada).Contains(item));
    EXPECT_FALSE(equipment.Get(ada).equipped.has_value());
    EXPECT_EQ(wallets.Get(ada).currency, 25);
    EXPECT_EQ(countNotices(NotificationKind::ItemSold), 1u);
}

TEST_F(LootSystemsTest, SellRequestForPlayerWithoutWalletFails) {
    auto ghost = entities.Create();
    inventories.Add(ghost);
    equipment.Add(ghost);
    sellRequests.Add(entities.Create(), SellRequest{ghost, ItemInstanceId(1)});

    SellSystem sell(sellRequests, inventories, equipment, wallets, profiles, feed);
    sell.Execute(0.0f);

    ASSERT_EQ(feed.Size(), 1u);
    EXPECT_EQ(feed.Pending()[0].code, ErrorCode::PlayerNotFound);
    EXPECT_FALSE(feed.Pending()[0].player.isValid());
}

// ===========================================================================
// LevelingSystem
// ===========================================================================

TEST_F(LootSystemsTest, LevelingAggregatesPerPlayer) {
    auto ada = addPlayer(1, "ada");
    acquire(ada, 150);
    acquire(ada, 150);

    LevelingSystem system(acquired, progressions, levelUps, profiles, entities, curve, 1.0,
                          feed);
    system.Execute(0.0f);

    EXPECT_EQ(progressions.Get(ada).experience, 300);
    EXPECT_EQ(progressions.Get(ada).level, 3u);
    ASSERT_EQ(levelUps.Size(), 1u);
    const auto& event = *levelUps.begin();
    EXPECT_EQ(event.fromLevel, 1u);
    EXPECT_EQ(event.toLevel, 3u);
    EXPECT_EQ(countNotices(NotificationKind::LevelUp), 1u);

    for (const auto& e : acquired) {
        EXPECT_TRUE(e.processed);
    }
}

TEST_F(LootSystemsTest, LevelingKeepsPlayersSeparate) {
    auto ada = addPlayer(1, "ada");
    auto bo = addPlayer(2, "bo");
    acquire(ada, 120);
    acquire(bo, 40);

    LevelingSystem system(acquired, progressions, levelUps, profiles, entities, curve, 1.0,
                          feed);
    system.Execute(0.0f);

    EXPECT_EQ(progressions.Get(ada).level, 2u);
    EXPECT_EQ(progressions.Get(bo).level, 1u);
    EXPECT_EQ(progressions.Get(bo).experience, 40);
    EXPECT_EQ(levelUps.Size(), 1u);
}

TEST_F(LootSystemsTest, LevelingIgnoresProcessedEvents) {
    auto ada = addPlayer(1, "ada");
    acquire(ada, 50);

    LevelingSystem system(acquired, progressions, levelUps, profiles, entities, curve, 2.0,
                          feed);
    system.Execute(0.0f);
    system.Execute(0.0f);

    EXPECT_EQ(progressions.Get(ada).experience, 100);
    EXPECT_EQ(progressions.Get(ada).level, 2u);
    EXPECT_EQ(levelUps.Size(), 1u);
}

// ===========================================================================
// HallOfFameSystem
// ===========================================================================

TEST_F(LootSystemsTest, HallOfFameRecordsLevelUpOnce) {
    auto ada = addPlayer(1, "ada");
    progressions.Get(ada) = Progression{3, 300};
    levelUps.Add(entities.Create(), LevelUpEvent{ada, 1, 3});

    HallOfFameSystem system(levelUps, profiles, progressions, hallOfFame);
    system.Execute(0.0f);
    system.Execute(0.0f);

    EXPECT_EQ(hallOfFame.UpdateCount(), 1u);
    const auto* row = hallOfFame.Find(PlayerId(1));
    ASSERT_NE(row, nullptr);
    EXPECT_EQ(row->name, "ada");
    EXPECT_EQ(row->level, 3u);
    EXPECT_EQ(row->score, 300);
}

TEST_F(LootSystemsTest, HallOfFameTiesFollowEventOrder) {
    HallOfFameSystem system(levelUps, profiles, progressions, hallOfFame);

    // Players join after the system is built; ada is created first but
    // levels up second.
    auto ada = addPlayer(1, "ada");
    auto bob = addPlayer(2, "bob");
    progressions.Get(ada) = Progression{2, 150};
    progressions.Get(bob) = Progression{2, 150};
    levelUps.Add(entities.Create(), LevelUpEvent{bob, 1, 2});
    levelUps.Add(entities.Create(), LevelUpEvent{ada, 1, 2});

    system.Execute(0.0f);

    const auto top = hallOfFame.Top(2);
    ASSERT_EQ(top.size(), 2u);
    EXPECT_EQ(top[0].playerId, PlayerId(2));
    EXPECT_EQ(top[1].playerId, PlayerId(1));
}

TEST_F(LootSystemsTest, HallOfFameSkipsUnknownPlayer) {
    auto ghost = entities.Create();
    levelUps.Add(entities.Create(), LevelUpEvent{ghost, 1, 2});

    HallOfFameSystem system(levelUps, profiles, progressions, hallOfFame);
    system.Execute(0.0f);

    EXPECT_TRUE(hallOfFame.Empty());
    EXPECT_TRUE(levelUps.begin()->processed);
}
