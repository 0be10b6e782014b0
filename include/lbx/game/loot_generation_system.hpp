#pragma once

/// @file loot_generation_system.hpp
/// @brief LootGenerationSystem: keeps the box pool stocked.

#include "lbx/ecs/system_scheduler.hpp"
#include "lbx/game/item_catalog.hpp"
#include "lbx/game/loot_config.hpp"
#include "lbx/game/loot_events.hpp"
#include "lbx/game/loot_pool.hpp"
#include "lbx/game/random_source.hpp"
#include "lbx/game/rarity.hpp"

#include <string_view>

namespace lbx::game {

/// Adds boxes to the pool according to the configured GenerationPolicy.
///
/// Runs in PreUpdate so boxes generated this frame are choosable by
/// BoxChoiceSystem in the same frame.  A full pool is not an error: the
/// system simply skips generation until a box is opened.
class LootGenerationSystem final : public lbx::ecs::ISystem {
public:
    LootGenerationSystem(LootBoxPool& pool, const ItemCatalog& catalog, RandomSource& rng,
                         LootFeed& feed, const LootConfig& config);

    void Execute(float deltaTime) override;

    [[nodiscard]] lbx::ecs::SystemStage GetStage() const override {
        return lbx::ecs::SystemStage::PreUpdate;
    }

    [[nodiscard]] std::string_view GetName() const override { return "LootGenerationSystem"; }

    /// Seconds accumulated toward the next Interval batch.
    [[nodiscard]] float Elapsed() const noexcept { return elapsed_; }

private:
    void generate(std::size_t count);

    LootBoxPool& pool_;
    const ItemCatalog& catalog_;
    RandomSource& rng_;
    LootFeed& feed_;
    const LootConfig& config_;
    RarityTable baseTable_;
    float elapsed_ = 0.0f;
};

}  // namespace lbx::game
