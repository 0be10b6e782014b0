#pragma once

/// @file lootbox_plugin.hpp
/// @brief Loot-box reward loop plugin: owns the world and runs its systems.
///
/// LootBoxPlugin owns all ECS infrastructure:
///   - EntityManager (players plus short-lived request/event entities)
///   - the component storages of players, requests and events
///   - SystemScheduler (staged execution of the seven loot systems)
///
/// and the world resources: LootBoxPool, HallOfFame, ItemCatalog,
/// RandomSource and the notification feed.
///
/// Player intents queue request entities that the systems consume on the
/// next frame.  The immediate API performs the same operations right away
/// for tools and tests.

#include <cstdint>
#include <string>
#include <unordered_map>

#include "lbx/ecs/component_storage.hpp"
#include "lbx/ecs/entity_manager.hpp"
#include "lbx/ecs/system_scheduler.hpp"
#include "lbx/foundation/game_result.hpp"
#include "lbx/foundation/types.hpp"
#include "lbx/game/hall_of_fame.hpp"
#include "lbx/game/item_catalog.hpp"
#include "lbx/game/loot_config.hpp"
#include "lbx/game/loot_events.hpp"
#include "lbx/game/loot_operations.hpp"
#include "lbx/game/loot_pool.hpp"
#include "lbx/game/player_components.hpp"
#include "lbx/game/random_source.hpp"
#include "lbx/plugin/iplugin.hpp"

namespace lbx::plugin {

/// Single-player loot-box loop.
///
/// System execution order per frame:
///   PreUpdate:  LootGenerationSystem
///   Update:     BoxChoiceSystem -> BoxOpeningSystem -> EquipSystem -> SellSystem
///   PostUpdate: LevelingSystem -> HallOfFameSystem
///
/// After the systems run, processed request and event entities are
/// destroyed and the frame's LootNotifications are published on the
/// context's EventBus.
class LootBoxPlugin : public IPlugin {
public:
    LootBoxPlugin();

    /// Use @p catalog instead of the built-in item templates.
    explicit LootBoxPlugin(lbx::game::ItemCatalog catalog);

    ~LootBoxPlugin() override;

    // ── IPlugin interface ──────────────────────────────────────────────

    [[nodiscard]] const PluginInfo& GetInfo() const override;

    /// Reads LootConfig from a ConfigManager in the service locator, if any.
    /// Fails on an invalid configuration.
    bool OnLoad(PluginContext& ctx) override;

    bool OnInit() override;
    void OnUpdate(float deltaTime) override;
    void OnShutdown() override;
    void OnUnload() override;

    [[nodiscard]] PluginState GetState() const noexcept { return state_; }

    // ── Players ────────────────────────────────────────────────────────

    /// Create a player with empty inventory, level 1, no currency.
    [[nodiscard]] lbx::foundation::GameResult<lbx::foundation::PlayerId> CreatePlayer(
        const std::string& name);

    [[nodiscard]] std::size_t PlayerCount() const noexcept { return players_.size(); }

    // ── Intents (consumed on the next frame) ───────────────────────────

    lbx::foundation::GameResult<void> RequestOpenBox(lbx::foundation::PlayerId player,
                                                     lbx::game::BoxSelection selection);
    lbx::foundation::GameResult<void> RequestEquip(lbx::foundation::PlayerId player,
                                                   lbx::foundation::ItemInstanceId item);
    lbx::foundation::GameResult<void> RequestSell(lbx::foundation::PlayerId player,
                                                  lbx::foundation::ItemInstanceId item);

    // ── Immediate operations ───────────────────────────────────────────

    /// Generate up to @p count boxes with the configured distribution.
    lbx::foundation::GameResult<std::size_t> GenerateBoxes(std::size_t count);

    /// Choose and open a box now.  Experience for the item is granted by
    /// LevelingSystem on the next frame.
    lbx::foundation::GameResult<lbx::foundation::ItemInstanceId> OpenBox(
        lbx::foundation::PlayerId player, lbx::game::BoxSelection selection);

    lbx::foundation::GameResult<void> Equip(lbx::foundation::PlayerId player,
                                            lbx::foundation::ItemInstanceId item);

    /// @return Whether an item was equipped before.
    lbx::foundation::GameResult<bool> Unequip(lbx::foundation::PlayerId player);

    /// @return Currency credited.
    lbx::foundation::GameResult<int64_t> Sell(lbx::foundation::PlayerId player,
                                              lbx::foundation::ItemInstanceId item);

    // ── Read-only accessors ────────────────────────────────────────────

    [[nodiscard]] const lbx::game::LootBoxPool& GetPool() const noexcept { return pool_; }
    [[nodiscard]] const lbx::game::HallOfFame& GetHallOfFame() const noexcept {
        return hallOfFame_;
    }
    [[nodiscard]] const lbx::game::ItemCatalog& GetCatalog() const noexcept { return catalog_; }
    [[nodiscard]] const lbx::game::LootConfig& GetConfig() const noexcept { return config_; }

    /// Component of a player, or nullptr for an unknown player.
    [[nodiscard]] const lbx::game::PlayerProfile* GetProfile(lbx::foundation::PlayerId player) const;
    [[nodiscard]] const lbx::game::Inventory* GetInventory(lbx::foundation::PlayerId player) const;
    [[nodiscard]] const lbx::game::Equipment* GetEquipment(lbx::foundation::PlayerId player) const;
    [[nodiscard]] const lbx::game::Wallet* GetWallet(lbx::foundation::PlayerId player) const;
    [[nodiscard]] const lbx::game::Progression* GetProgression(
        lbx::foundation::PlayerId player) const;

    [[nodiscard]] uint64_t FrameCount() const noexcept { return frame_; }

    // ── ECS access (for testing and advanced usage) ────────────────────

    [[nodiscard]] lbx::ecs::EntityManager& GetEntityManager() noexcept { return entityManager_; }
    [[nodiscard]] lbx::ecs::SystemScheduler& GetScheduler() noexcept { return scheduler_; }

private:
    void registerComponentStorages();

    /// Entity of a known player, or PlayerNotFound.
    [[nodiscard]] lbx::foundation::GameResult<lbx::ecs::Entity> findPlayer(
        lbx::foundation::PlayerId player) const;

    /// Destroy every request/event entity a system has marked processed.
    void collectProcessed();

    /// Publish and flush the frame's notifications.
    void publishNotifications();

    PluginInfo info_;
    PluginContext* ctx_ = nullptr;
    PluginState state_ = PluginState::Unloaded;

    // ── ECS core infrastructure ────────────────────────────────────────

    lbx::ecs::EntityManager entityManager_;
    lbx::ecs::SystemScheduler scheduler_;

    // ── Component storages ─────────────────────────────────────────────

    // Player components
    lbx::ecs::ComponentStorage<lbx::game::PlayerProfile> profiles_;
    lbx::ecs::ComponentStorage<lbx::game::Inventory> inventories_;
    lbx::ecs::ComponentStorage<lbx::game::Equipment> equipment_;
    lbx::ecs::ComponentStorage<lbx::game::Wallet> wallets_;
    lbx::ecs::ComponentStorage<lbx::game::Progression> progressions_;

    // Requests
    lbx::ecs::ComponentStorage<lbx::game::OpenBoxRequest> openRequests_;
    lbx::ecs::ComponentStorage<lbx::game::EquipRequest> equipRequests_;
    lbx::ecs::ComponentStorage<lbx::game::SellRequest> sellRequests_;

    // In-frame events
    lbx::ecs::ComponentStorage<lbx::game::ItemAcquiredEvent> acquiredEvents_;
    lbx::ecs::ComponentStorage<lbx::game::LevelUpEvent> levelUpEvents_;

    // ── Resources ──────────────────────────────────────────────────────

    lbx::game::LootConfig config_;
    lbx::game::ItemCatalog catalog_;
    lbx::game::LootBoxPool pool_;
    lbx::game::HallOfFame hallOfFame_;
    lbx::game::RandomSource rng_{1};
    lbx::game::LootFeed feed_;

    std::unordered_map<lbx::foundation::PlayerId, lbx::ecs::Entity> players_;
    uint64_t nextPlayerId_ = 1;
    uint64_t frame_ = 0;
};

} // namespace lbx::plugin
