/// @file main.cpp
/// @brief lootbox_sim entry point.
///
/// Headless runner for the loot-box loop.  Loads the YAML configuration,
/// creates a few players and drives LootBoxPlugin for a fixed number of
/// frames, letting every player open the first available box each frame.
///
/// Usage: lootbox_sim [--config <path>] [--frames N] [--players N] [--dt SECONDS]

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <kcenon/common/interfaces/global_logger_registry.h>

#include "console_logger.hpp"
#include "lbx/foundation/config_manager.hpp"
#include "lbx/foundation/game_logger.hpp"
#include "lbx/foundation/service_locator.hpp"
#include "lbx/game/loot_events.hpp"
#include "lbx/plugin/event_bus.hpp"
#include "lbx/plugin/lootbox_plugin.hpp"
#include "lbx/version.hpp"

namespace {

using lbx::foundation::ItemInstanceId;
using lbx::foundation::LogCategory;
using lbx::foundation::PlayerId;

struct RunOptions {
    std::filesystem::path configPath;
    unsigned long frames = 60;
    unsigned long players = 3;
    float deltaTime = 0.5F;
};

/// Value following @p flag, if present.
std::optional<std::string_view> findArg(int argc, char* argv[], std::string_view flag) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == flag) {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return std::string_view(argv[i + 1]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return std::nullopt;
}

bool parseCount(std::string_view text, unsigned long& out) {
    unsigned long value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || value == 0) {
        return false;
    }
    out = value;
    return true;
}

bool parseOptions(int argc, char* argv[], RunOptions& opts) {
    if (auto path = findArg(argc, argv, "--config")) {
        opts.configPath = std::string(*path);
    }
    // Environment variable override for 12-factor compliance.
    if (const char* envPath = std::getenv("LBX_CONFIG_PATH"); envPath != nullptr) {
        opts.configPath = envPath;
    }

    if (auto frames = findArg(argc, argv, "--frames")) {
        if (!parseCount(*frames, opts.frames)) {
            std::cerr << "Invalid --frames value: " << *frames << "\n";
            return false;
        }
    }
    if (auto players = findArg(argc, argv, "--players")) {
        if (!parseCount(*players, opts.players)) {
            std::cerr << "Invalid --players value: " << *players << "\n";
            return false;
        }
    }
    if (auto dt = findArg(argc, argv, "--dt")) {
        try {
            opts.deltaTime = std::stof(std::string(*dt));
        } catch (const std::exception&) {
            opts.deltaTime = 0.0F;
        }
        if (!(opts.deltaTime > 0.0F)) {
            std::cerr << "Invalid --dt value: " << *dt << "\n";
            return false;
        }
    }
    return true;
}

/// Equip the most valuable item and sell the cheapest once a player
/// carries more than @p keep items.
void manageInventory(lbx::plugin::LootBoxPlugin& plugin, PlayerId player, std::size_t keep) {
    const auto* inventory = plugin.GetInventory(player);
    if (inventory == nullptr || inventory->Size() <= keep) {
        return;
    }

    ItemInstanceId best;
    ItemInstanceId worst;
    int64_t bestValue = -1;
    int64_t worstValue = 0;
    for (const auto& [id, item] : inventory->items) {
        const auto value = item.Value();
        if (value > bestValue) {
            bestValue = value;
            best = id;
        }
        if (!worst.isValid() || value < worstValue) {
            worstValue = value;
            worst = id;
        }
    }

    const auto* equipment = plugin.GetEquipment(player);
    if (equipment != nullptr && !equipment->IsEquipped(best)) {
        (void)plugin.RequestEquip(player, best);
    }
    if (worst != best) {
        (void)plugin.RequestSell(player, worst);
    }
}

void printHallOfFame(const lbx::plugin::LootBoxPlugin& plugin) {
    std::cout << "Hall of fame:\n";
    const auto top = plugin.GetHallOfFame().Top(10);
    if (top.empty()) {
        std::cout << "  (empty)\n";
        return;
    }
    std::size_t rank = 1;
    for (const auto& entry : top) {
        std::cout << "  " << rank++ << ". " << entry.name << "  level " << entry.level
                  << "  xp " << entry.score << "\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    RunOptions opts;
    if (!parseOptions(argc, argv, opts)) {
        return EXIT_FAILURE;
    }

    auto& registry = kcenon::common::interfaces::GlobalLoggerRegistry::instance();
    registry.set_default_logger(std::make_shared<lbx::app::ConsoleLogger>());

    lbx::foundation::ServiceLocator services;
    if (!opts.configPath.empty()) {
        auto config = std::make_shared<lbx::foundation::ConfigManager>();
        auto loadResult = config->load(opts.configPath);
        if (!loadResult) {
            std::cerr << "Failed to load config: " << loadResult.error().message() << "\n";
            return EXIT_FAILURE;
        }
        services.add<lbx::foundation::ConfigManager>(std::move(config));
    }

    lbx::plugin::EventBus bus;
    std::size_t levelUps = 0;
    std::size_t failures = 0;
    bus.Subscribe<lbx::game::LootNotification>([&](const lbx::game::LootNotification& n) {
        if (n.kind == lbx::game::NotificationKind::LevelUp) {
            ++levelUps;
        } else if (n.kind == lbx::game::NotificationKind::ActionFailed) {
            ++failures;
        }
    });

    lbx::plugin::PluginContext ctx{&services, &bus};
    lbx::plugin::LootBoxPlugin plugin;

    if (!plugin.OnLoad(ctx) || !plugin.OnInit()) {
        std::cerr << "Failed to start loot box plugin\n";
        return EXIT_FAILURE;
    }

    std::vector<PlayerId> players;
    for (unsigned long i = 0; i < opts.players; ++i) {
        auto created = plugin.CreatePlayer("player-" + std::to_string(i + 1));
        if (!created) {
            std::cerr << "Failed to create player: " << created.error().message() << "\n";
            return EXIT_FAILURE;
        }
        players.push_back(created.value());
    }

    std::cout << "lootbox_sim " << lbx::Version::string << " (" << opts.frames << " frames, "
              << players.size() << " players)\n";

    for (unsigned long frame = 0; frame < opts.frames; ++frame) {
        for (const auto player : players) {
            if (!plugin.GetPool().Empty()) {
                (void)plugin.RequestOpenBox(player, lbx::game::BoxSelection::AutoFirst());
            }
            manageInventory(plugin, player, 4);
        }
        plugin.OnUpdate(opts.deltaTime);
    }

    LBX_LOG_INFO(LogCategory::Core,
                 "Simulation finished: " + std::to_string(levelUps) + " level-ups, " +
                     std::to_string(failures) + " failed actions, " +
                     std::to_string(plugin.GetPool().ExtractedCount()) + " boxes opened");

    printHallOfFame(plugin);
    for (const auto player : players) {
        const auto* wallet = plugin.GetWallet(player);
        const auto* inventory = plugin.GetInventory(player);
        const auto* profile = plugin.GetProfile(player);
        if (wallet != nullptr && inventory != nullptr && profile != nullptr) {
            std::cout << "  " << profile->name << ": " << inventory->Size() << " items, "
                      << wallet->currency << " currency\n";
        }
    }

    plugin.OnShutdown();
    plugin.OnUnload();
    (void)lbx::foundation::GameLogger::instance().flush();
    return EXIT_SUCCESS;
}
