/// @file lootbox_plugin.cpp
/// @brief Implementation of the loot-box reward loop plugin.
///
/// @see lootbox_plugin.hpp

#include "lbx/plugin/lootbox_plugin.hpp"

#include <string>
#include <utility>

#include "lbx/foundation/config_manager.hpp"
#include "lbx/foundation/game_logger.hpp"
#include "lbx/game/box_choice_system.hpp"
#include "lbx/game/box_opening_system.hpp"
#include "lbx/game/equipment_systems.hpp"
#include "lbx/game/hall_of_fame_system.hpp"
#include "lbx/game/leveling_system.hpp"
#include "lbx/game/loot_generation_system.hpp"
#include "lbx/plugin/event_bus.hpp"

namespace lbx::plugin {

using lbx::foundation::ErrorCode;
using lbx::foundation::GameError;
using lbx::foundation::GameResult;
using lbx::foundation::ItemInstanceId;
using lbx::foundation::LogCategory;
using lbx::foundation::LogContext;
using lbx::foundation::LogLevel;
using lbx::foundation::PlayerId;

namespace game = lbx::game;

namespace {

/// Queue every processed request/event entity of @p storage for destruction.
template <typename T>
void destroyProcessed(lbx::ecs::ComponentStorage<T>& storage,
                      lbx::ecs::EntityManager& entities) {
    for (std::size_t i = 0; i < storage.Size(); ++i) {
        const auto id = storage.EntityAt(i);
        if (storage.Get(lbx::ecs::Entity(id, 0)).processed) {
            entities.DestroyDeferred(entities.HandleOf(id));
        }
    }
}

} // namespace

// ============================================================================
// Construction / Destruction
// ============================================================================

LootBoxPlugin::LootBoxPlugin() : LootBoxPlugin(game::ItemCatalog::Builtin()) {}

LootBoxPlugin::LootBoxPlugin(game::ItemCatalog catalog)
    : info_{"LootBoxPlugin",
            "Single-player loot-box reward loop",
            {1, 0, 0},
            {},
            kPluginApiVersion},
      catalog_(std::move(catalog)) {
    registerComponentStorages();
}

LootBoxPlugin::~LootBoxPlugin() = default;

void LootBoxPlugin::registerComponentStorages() {
    entityManager_.RegisterStorage(&profiles_);
    entityManager_.RegisterStorage(&inventories_);
    entityManager_.RegisterStorage(&equipment_);
    entityManager_.RegisterStorage(&wallets_);
    entityManager_.RegisterStorage(&progressions_);
    entityManager_.RegisterStorage(&openRequests_);
    entityManager_.RegisterStorage(&equipRequests_);
    entityManager_.RegisterStorage(&sellRequests_);
    entityManager_.RegisterStorage(&acquiredEvents_);
    entityManager_.RegisterStorage(&levelUpEvents_);
}

// ============================================================================
// IPlugin Interface
// ============================================================================

const PluginInfo& LootBoxPlugin::GetInfo() const {
    return info_;
}

bool LootBoxPlugin::OnLoad(PluginContext& ctx) {
    ctx_ = &ctx;

    auto* config = ctx.services != nullptr ? ctx.services->get<lbx::foundation::ConfigManager>()
                                           : nullptr;
    if (config != nullptr) {
        auto loaded = game::LootConfig::FromConfig(*config);
        if (!loaded) {
            LBX_LOG_ERROR(LogCategory::Config,
                          "Invalid loot configuration: " + std::string(loaded.error().message()));
            state_ = PluginState::Error;
            return false;
        }
        config_ = std::move(loaded).value();
    } else {
        LBX_LOG_INFO(LogCategory::Config, "No ConfigManager registered, using defaults");
    }

    rng_ = config_.seed == 0 ? game::RandomSource::FromEntropy()
                             : game::RandomSource(config_.seed);
    pool_ = game::LootBoxPool(config_.poolCapacity, config_.rarity);

    LBX_LOG_INFO(LogCategory::Plugin,
                 "LootBoxPlugin loaded (seed " + std::to_string(rng_.Seed()) + ", pool " +
                     std::to_string(config_.poolCapacity) + ", policy " +
                     std::string(game::generationPolicyName(config_.policy)) + ")");
    state_ = PluginState::Loaded;
    return true;
}

bool LootBoxPlugin::OnInit() {
    if (state_ != PluginState::Loaded) {
        LBX_LOG_ERROR(LogCategory::Plugin, "OnInit called before a successful OnLoad");
        return false;
    }

    scheduler_.Register<game::LootGenerationSystem>(pool_, catalog_, rng_, feed_, config_);

    scheduler_.Register<game::BoxChoiceSystem>(openRequests_, pool_, profiles_, feed_);

    scheduler_.Register<game::BoxOpeningSystem>(openRequests_, inventories_, profiles_,
                                                acquiredEvents_, entityManager_, pool_, rng_,
                                                feed_);

    scheduler_.Register<game::EquipSystem>(equipRequests_, inventories_, equipment_, profiles_,
                                           feed_);

    scheduler_.Register<game::SellSystem>(sellRequests_, inventories_, equipment_, wallets_,
                                          profiles_, feed_);

    scheduler_.Register<game::LevelingSystem>(acquiredEvents_, progressions_, levelUpEvents_,
                                              profiles_, entityManager_, config_.curve,
                                              config_.xpPerValue, feed_);

    scheduler_.Register<game::HallOfFameSystem>(levelUpEvents_, profiles_, progressions_,
                                                hallOfFame_);

    const bool ordered =
        scheduler_.AddDependency<game::BoxChoiceSystem, game::BoxOpeningSystem>() &&
        scheduler_.AddDependency<game::BoxOpeningSystem, game::EquipSystem>() &&
        scheduler_.AddDependency<game::EquipSystem, game::SellSystem>() &&
        scheduler_.AddDependency<game::LevelingSystem, game::HallOfFameSystem>();
    if (!ordered) {
        LBX_LOG_ERROR(LogCategory::Plugin, "Failed to declare system dependencies");
        state_ = PluginState::Error;
        return false;
    }

    // Build the execution plan (topological sort per stage).
    if (!scheduler_.Build()) {
        LBX_LOG_ERROR(LogCategory::Plugin, scheduler_.GetLastError());
        state_ = PluginState::Error;
        return false;
    }

    state_ = PluginState::Active;
    return true;
}

void LootBoxPlugin::OnUpdate(float deltaTime) {
    if (state_ != PluginState::Active) {
        return;
    }

    scheduler_.Execute(deltaTime);
    collectProcessed();
    entityManager_.FlushDeferred();
    publishNotifications();
    ++frame_;
}

void LootBoxPlugin::OnShutdown() {
    for (std::size_t id = 0; id < entityManager_.Capacity(); ++id) {
        auto entity = entityManager_.HandleOf(static_cast<uint32_t>(id));
        if (entity.isValid()) {
            entityManager_.Destroy(entity);
        }
    }
    players_.clear();
    (void)feed_.Drain();

    LBX_LOG_INFO(LogCategory::Plugin,
                 "LootBoxPlugin shut down after " + std::to_string(frame_) + " frames");
    state_ = PluginState::Unloaded;
}

void LootBoxPlugin::OnUnload() {
    ctx_ = nullptr;
}

// ============================================================================
// Frame bookkeeping
// ============================================================================

void LootBoxPlugin::collectProcessed() {
    destroyProcessed(openRequests_, entityManager_);
    destroyProcessed(equipRequests_, entityManager_);
    destroyProcessed(sellRequests_, entityManager_);
    destroyProcessed(acquiredEvents_, entityManager_);
    destroyProcessed(levelUpEvents_, entityManager_);
}

void LootBoxPlugin::publishNotifications() {
    auto notices = feed_.Drain();
    if (ctx_ == nullptr || ctx_->eventBus == nullptr) {
        return;
    }
    for (auto& notice : notices) {
        ctx_->eventBus->PublishDeferred(std::move(notice));
    }
    ctx_->eventBus->ProcessDeferred();
}

// ============================================================================
// Players
// ============================================================================

GameResult<PlayerId> LootBoxPlugin::CreatePlayer(const std::string& name) {
    if (name.empty()) {
        return GameResult<PlayerId>::err(
            GameError(ErrorCode::InvalidArgument, "player name must not be empty"));
    }

    const PlayerId id{nextPlayerId_++};
    auto entity = entityManager_.Create();

    profiles_.Add(entity, game::PlayerProfile{id, name});
    inventories_.Add(entity, game::Inventory{});
    equipment_.Add(entity, game::Equipment{});
    wallets_.Add(entity, game::Wallet{});
    progressions_.Add(entity, game::Progression{});
    players_.emplace(id, entity);

    LogContext ctx;
    ctx.playerId = id;
    LBX_LOG_CTX(LogLevel::Info, LogCategory::Core, "Player created: " + name, ctx);
    return GameResult<PlayerId>::ok(id);
}

GameResult<lbx::ecs::Entity> LootBoxPlugin::findPlayer(PlayerId player) const {
    if (auto it = players_.find(player); it != players_.end()) {
        return GameResult<lbx::ecs::Entity>::ok(it->second);
    }
    return GameResult<lbx::ecs::Entity>::err(GameError(
        ErrorCode::PlayerNotFound, "unknown player " + std::to_string(player.value())));
}

// ============================================================================
// Intents
// ============================================================================

GameResult<void> LootBoxPlugin::RequestOpenBox(PlayerId player, game::BoxSelection selection) {
    auto entity = findPlayer(player);
    if (!entity) {
        return GameResult<void>::err(entity.error());
    }
    auto request = entityManager_.Create();
    openRequests_.Add(request, game::OpenBoxRequest{entity.value(), selection, std::nullopt});
    return GameResult<void>::ok();
}

GameResult<void> LootBoxPlugin::RequestEquip(PlayerId player, ItemInstanceId item) {
    auto entity = findPlayer(player);
    if (!entity) {
        return GameResult<void>::err(entity.error());
    }
    auto request = entityManager_.Create();
    equipRequests_.Add(request, game::EquipRequest{entity.value(), item});
    return GameResult<void>::ok();
}

GameResult<void> LootBoxPlugin::RequestSell(PlayerId player, ItemInstanceId item) {
    auto entity = findPlayer(player);
    if (!entity) {
        return GameResult<void>::err(entity.error());
    }
    auto request = entityManager_.Create();
    sellRequests_.Add(request, game::SellRequest{entity.value(), item});
    return GameResult<void>::ok();
}

// ============================================================================
// Immediate operations
// ============================================================================

GameResult<std::size_t> LootBoxPlugin::GenerateBoxes(std::size_t count) {
    auto generated = game::GenerateBoxes(pool_, count, catalog_, config_.distribution,
                                         config_.templatesPerTier,
                                         config_.rarity.SelectionTable(), rng_);
    if (generated && generated.value() > 0) {
        feed_.Push(PlayerId{}, game::NotificationKind::BoxGenerated,
                   std::to_string(generated.value()) + " loot box(es) generated");
    }
    return generated;
}

GameResult<ItemInstanceId> LootBoxPlugin::OpenBox(PlayerId player,
                                                  game::BoxSelection selection) {
    auto entity = findPlayer(player);
    if (!entity) {
        return GameResult<ItemInstanceId>::err(entity.error());
    }

    auto chosen = game::ChooseBox(pool_, selection);
    if (!chosen) {
        return GameResult<ItemInstanceId>::err(chosen.error());
    }
    const auto boxId = chosen.value()->id;

    auto& inventory = inventories_.Get(entity.value());
    auto opened = game::OpenBox(pool_, boxId, inventory, rng_);
    if (!opened) {
        return opened;
    }

    const auto& item = *inventory.Find(opened.value());
    acquiredEvents_.Add(entityManager_.Create(), game::ItemAcquiredEvent{entity.value(), item});
    feed_.Push(player, game::NotificationKind::BoxOpened,
               "Box " + std::to_string(boxId.value()) + " contained " + item.Name());
    return opened;
}

GameResult<void> LootBoxPlugin::Equip(PlayerId player, ItemInstanceId item) {
    auto entity = findPlayer(player);
    if (!entity) {
        return GameResult<void>::err(entity.error());
    }
    const auto& inventory = inventories_.Get(entity.value());
    auto equipped = game::EquipItem(inventory, equipment_.Get(entity.value()), item);
    if (equipped) {
        feed_.Push(player, game::NotificationKind::ItemEquipped,
                   "Equipped " + inventory.Find(item)->Name());
    }
    return equipped;
}

GameResult<bool> LootBoxPlugin::Unequip(PlayerId player) {
    auto entity = findPlayer(player);
    if (!entity) {
        return GameResult<bool>::err(entity.error());
    }
    return GameResult<bool>::ok(game::UnequipItem(equipment_.Get(entity.value())));
}

GameResult<int64_t> LootBoxPlugin::Sell(PlayerId player, ItemInstanceId item) {
    auto entity = findPlayer(player);
    if (!entity) {
        return GameResult<int64_t>::err(entity.error());
    }
    auto sold = game::SellItem(inventories_.Get(entity.value()), equipment_.Get(entity.value()),
                               wallets_.Get(entity.value()), item);
    if (sold) {
        feed_.Push(player, game::NotificationKind::ItemSold,
                   "Sold item " + std::to_string(item.value()) + " for " +
                       std::to_string(sold.value()));
    }
    return sold;
}

// ============================================================================
// Accessors
// ============================================================================

const game::PlayerProfile* LootBoxPlugin::GetProfile(PlayerId player) const {
    auto entity = findPlayer(player);
    return entity ? profiles_.Find(entity.value()) : nullptr;
}

const game::Inventory* LootBoxPlugin::GetInventory(PlayerId player) const {
    auto entity = findPlayer(player);
    return entity ? inventories_.Find(entity.value()) : nullptr;
}

const game::Equipment* LootBoxPlugin::GetEquipment(PlayerId player) const {
    auto entity = findPlayer(player);
    return entity ? equipment_.Find(entity.value()) : nullptr;
}

const game::Wallet* LootBoxPlugin::GetWallet(PlayerId player) const {
    auto entity = findPlayer(player);
    return entity ? wallets_.Find(entity.value()) : nullptr;
}

const game::Progression* LootBoxPlugin::GetProgression(PlayerId player) const {
    auto entity = findPlayer(player);
    return entity ? progressions_.Find(entity.value()) : nullptr;
}

} // namespace lbx::plugin
