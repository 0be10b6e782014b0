#include <gtest/gtest.h>

#include "lbx/foundation/config_manager.hpp"
#include "lbx/foundation/error_code.hpp"
#include "lbx/foundation/service_locator.hpp"
#include "lbx/foundation/types.hpp"
#include "lbx/game/item_catalog.hpp"
#include "lbx/plugin/event_bus.hpp"
#include "lbx/plugin/lootbox_plugin.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

using namespace lbx::plugin;
using lbx::foundation::ConfigManager;
using lbx::foundation::ErrorCode;
using lbx::foundation::ItemInstanceId;
using lbx::foundation::PlayerId;
using lbx::game::BoxSelection;
using lbx::game::ItemCatalog;
using lbx::game::ItemKind;
using lbx::game::ItemTemplate;
using lbx::game::LootNotification;
using lbx::game::NotificationKind;
using lbx::game::Rarity;

namespace {

/// Catalog whose only template is a Common item worth @p value.
ItemCatalog singleTemplateCatalog(int64_t value) {
    ItemCatalog catalog;
    auto registered =
        catalog.RegisterTemplate(ItemTemplate{1, "Training Dummy", ItemKind::Trinket,
                                              Rarity::Common, value, {}});
    EXPECT_TRUE(registered);
    return catalog;
}

}  // namespace

// =============================================================================
// Integration fixture: plugin driven frame by frame
// =============================================================================

class LootLoopIntegrationTest : public ::testing::Test {
protected:
    void start(LootBoxPlugin& plugin, const std::string& yaml) {
        auto config = std::make_shared<ConfigManager>();
        ASSERT_TRUE(config->loadFromString(yaml));
        services_.add<ConfigManager>(config);
        bus_.Subscribe<LootNotification>([this](const LootNotification& n) {
            ++noticesByKind_[n.kind];
        });
        ASSERT_TRUE(plugin.OnLoad(ctx_));
        ASSERT_TRUE(plugin.OnInit());
    }

    std::size_t notices(NotificationKind kind) const {
        auto it = noticesByKind_.find(kind);
        return it == noticesByKind_.end() ? 0 : it->second;
    }

    lbx::foundation::ServiceLocator services_;
    EventBus bus_;
    PluginContext ctx_{&services_, &bus_};
    std::map<NotificationKind, std::size_t> noticesByKind_;
};

// =============================================================================
// Multi-level jump in one frame
// =============================================================================

TEST_F(LootLoopIntegrationTest, SingleItemCrossingTwoThresholds) {
    LootBoxPlugin plugin(singleTemplateCatalog(300));
    start(plugin, "random:\n  seed: 3\ngeneration:\n  policy: manual\n");

    auto player = plugin.CreatePlayer("ada").value();
    ASSERT_TRUE(plugin.GenerateBoxes(1));
    ASSERT_TRUE(plugin.RequestOpenBox(player, BoxSelection::AutoFirst()));
    plugin.OnUpdate(0.1f);

    const auto* progression = plugin.GetProgression(player);
    EXPECT_EQ(progression->experience, 300);
    EXPECT_EQ(progression->level, 3u);

    EXPECT_EQ(plugin.GetHallOfFame().UpdateCount(), 1u);
    EXPECT_EQ(plugin.GetHallOfFame().RankOf(player), 1u);
    EXPECT_EQ(plugin.GetHallOfFame().Find(player)->level, 3u);
    EXPECT_EQ(notices(NotificationKind::LevelUp), 1u);
}

TEST_F(LootLoopIntegrationTest, TwoItemsInOneFrameAggregate) {
    LootBoxPlugin plugin(singleTemplateCatalog(150));
    start(plugin, "random:\n  seed: 3\ngeneration:\n  policy: manual\n");

    auto player = plugin.CreatePlayer("ada").value();
    ASSERT_TRUE(plugin.GenerateBoxes(2));
    ASSERT_TRUE(plugin.RequestOpenBox(player, BoxSelection::AutoFirst()));
    ASSERT_TRUE(plugin.RequestOpenBox(player, BoxSelection::AutoFirst()));
    plugin.OnUpdate(0.1f);

    EXPECT_TRUE(plugin.GetPool().Empty());
    EXPECT_EQ(plugin.GetInventory(player)->Size(), 2u);
    EXPECT_EQ(plugin.GetProgression(player)->level, 3u);
    EXPECT_EQ(plugin.GetHallOfFame().UpdateCount(), 1u);
    EXPECT_EQ(notices(NotificationKind::LevelUp), 1u);
    EXPECT_EQ(notices(NotificationKind::BoxOpened), 2u);
}

TEST_F(LootLoopIntegrationTest, SoldItemStillCountsForExperience) {
    LootBoxPlugin plugin(singleTemplateCatalog(120));
    start(plugin, "random:\n  seed: 3\ngeneration:\n  policy: manual\n");

    auto player = plugin.CreatePlayer("ada").value();
    ASSERT_TRUE(plugin.GenerateBoxes(1));
    auto item = plugin.OpenBox(player, BoxSelection::AutoFirst());
    ASSERT_TRUE(item);
    ASSERT_TRUE(plugin.RequestSell(player, item.value()));
    plugin.OnUpdate(0.1f);

    EXPECT_EQ(plugin.GetWallet(player)->currency, 120);
    EXPECT_EQ(plugin.GetInventory(player)->Size(), 0u);
    EXPECT_EQ(plugin.GetProgression(player)->experience, 120);
    EXPECT_EQ(plugin.GetProgression(player)->level, 2u);
}

// =============================================================================
// Full session
// =============================================================================

TEST_F(LootLoopIntegrationTest, MultiPlayerSessionKeepsInvariants) {
    LootBoxPlugin plugin;
    start(plugin,
          "random:\n  seed: 42\n"
          "pool:\n  capacity: 5\n"
          "generation:\n  policy: interval\n  interval_seconds: 1.0\n  batch_size: 2\n");

    std::vector<PlayerId> players;
    for (int i = 1; i <= 3; ++i) {
        players.push_back(plugin.CreatePlayer("player-" + std::to_string(i)).value());
    }

    for (int frame = 0; frame < 120; ++frame) {
        for (const auto& player : players) {
            if (!plugin.GetPool().Empty()) {
                ASSERT_TRUE(plugin.RequestOpenBox(player, BoxSelection::AutoFirst()));
            }

            const auto* inventory = plugin.GetInventory(player);
            if (inventory->Size() > 3) {
                // Equip the most valuable item, sell the least valuable one.
                ItemInstanceId best = inventory->items.begin()->first;
                ItemInstanceId worst = best;
                for (const auto& [id, item] : inventory->items) {
                    if (item.Value() > inventory->Find(best)->Value()) {
                        best = id;
                    }
                    if (item.Value() < inventory->Find(worst)->Value()) {
                        worst = id;
                    }
                }
                ASSERT_TRUE(plugin.RequestEquip(player, best));
                if (worst != best) {
                    ASSERT_TRUE(plugin.RequestSell(player, worst));
                }
            }
        }

        plugin.OnUpdate(0.5f);

        ASSERT_LE(plugin.GetPool().Size(), plugin.GetPool().Capacity());
        ASSERT_EQ(plugin.GetEntityManager().Count(), players.size());
        for (const auto& player : players) {
            const auto* equipment = plugin.GetEquipment(player);
            if (equipment->equipped) {
                ASSERT_TRUE(plugin.GetInventory(player)->Contains(*equipment->equipped));
            }
            ASSERT_GE(plugin.GetWallet(player)->currency, 0);
            const auto* progression = plugin.GetProgression(player);
            ASSERT_EQ(progression->level,
                      plugin.GetConfig().curve.LevelFor(progression->experience));
        }
    }

    EXPECT_EQ(plugin.FrameCount(), 120u);
    EXPECT_GT(plugin.GetPool().ExtractedCount(), 0u);
    EXPECT_EQ(notices(NotificationKind::LevelUp), plugin.GetHallOfFame().UpdateCount());

    const auto& hof = plugin.GetHallOfFame();
    EXPECT_LE(hof.Size(), players.size());
    const auto top = hof.Top(10);
    for (std::size_t i = 1; i < top.size(); ++i) {
        EXPECT_GE(top[i - 1].level, top[i].level);
    }
    for (const auto& row : top) {
        EXPECT_EQ(row.level, plugin.GetProgression(row.playerId)->level);
    }

    plugin.OnShutdown();
    EXPECT_EQ(plugin.GetEntityManager().Count(), 0u);
    plugin.OnUnload();
}
