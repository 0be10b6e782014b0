/// @file loot_generation_system.cpp
/// @brief LootGenerationSystem implementation.

#include "lbx/game/loot_generation_system.hpp"

#include "lbx/foundation/game_logger.hpp"

#include <string>

namespace lbx::game {

using foundation::LogCategory;

LootGenerationSystem::LootGenerationSystem(LootBoxPool& pool, const ItemCatalog& catalog,
                                           RandomSource& rng, LootFeed& feed,
                                           const LootConfig& config)
    : pool_(pool),
      catalog_(catalog),
      rng_(rng),
      feed_(feed),
      config_(config),
      baseTable_(config.rarity.SelectionTable()) {}

void LootGenerationSystem::Execute(float deltaTime) {
    switch (config_.policy) {
        case GenerationPolicy::Manual:
            return;

        case GenerationPolicy::Refill:
            if (!pool_.IsFull()) {
                generate(pool_.FreeSlots());
            }
            return;

        case GenerationPolicy::Interval: {
            elapsed_ += deltaTime;
            const auto interval = static_cast<float>(config_.intervalSeconds);
            if (elapsed_ < interval) {
                return;
            }
            // One batch per frame at most; leftover time carries over.
            elapsed_ = interval > 0.0f ? elapsed_ - interval : 0.0f;
            if (pool_.IsFull()) {
                LBX_LOG_DEBUG(LogCategory::Loot, "Pool at capacity, skipping generation");
                return;
            }
            generate(config_.batchSize);
            return;
        }
    }
}

void LootGenerationSystem::generate(std::size_t count) {
    auto result = GenerateBoxes(pool_, count, catalog_, config_.distribution,
                                config_.templatesPerTier, baseTable_, rng_);
    if (!result) {
        if (result.error().isInformational()) {
            LBX_LOG_DEBUG(LogCategory::Loot, result.error().message());
        } else {
            LBX_LOG_ERROR(LogCategory::Loot,
                          "Box generation failed: " + std::string(result.error().message()));
        }
        return;
    }

    const auto generated = result.value();
    if (generated == 0) {
        return;
    }
    feed_.Push(foundation::PlayerId{}, NotificationKind::BoxGenerated,
               std::to_string(generated) + " loot box(es) generated, pool " +
                   std::to_string(pool_.Size()) + "/" + std::to_string(pool_.Capacity()));
}

}  // namespace lbx::game
