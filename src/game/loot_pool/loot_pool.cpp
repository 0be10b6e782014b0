/// @file loot_pool.cpp
/// @brief LootBoxPool bookkeeping and box generation.

#include "lbx/game/loot_pool.hpp"

#include "lbx/foundation/game_logger.hpp"

#include <algorithm>
#include <numeric>
#include <string>
#include <utility>

namespace lbx::game {

using foundation::BoxId;
using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

std::string_view boxDistributionName(BoxDistribution d) noexcept {
    switch (d) {
        case BoxDistribution::Uniform: return "uniform";
        case BoxDistribution::Skewed:  return "skewed";
        case BoxDistribution::Mixed:   return "mixed";
    }
    return "unknown";
}

std::optional<BoxDistribution> parseBoxDistribution(std::string_view name) noexcept {
    for (auto d : {BoxDistribution::Uniform, BoxDistribution::Skewed, BoxDistribution::Mixed}) {
        if (boxDistributionName(d) == name) {
            return d;
        }
    }
    return std::nullopt;
}

std::size_t LootBox::CandidateCount() const noexcept {
    std::size_t total = 0;
    for (const auto& tier : candidates) {
        total += tier.size();
    }
    return total;
}

// -- LootBoxPool --------------------------------------------------------------

LootBoxPool::LootBoxPool(std::size_t capacity, RarityProfile profile)
    : capacity_(capacity), profile_(std::move(profile)) {}

GameResult<BoxId> LootBoxPool::Insert(LootBox box) {
    if (IsFull()) {
        return GameResult<BoxId>::err(GameError(
            ErrorCode::PoolAtCapacity,
            "loot box pool is full (" + std::to_string(capacity_) + " boxes)"));
    }
    if (!box.id.isValid()) {
        return GameResult<BoxId>::err(
            GameError(ErrorCode::InvalidArgument, "loot box has no id"));
    }
    if (box.table.Empty()) {
        return GameResult<BoxId>::err(GameError(
            ErrorCode::InvalidArgument,
            "loot box " + std::to_string(box.id.value()) + " has no rarity tiers"));
    }
    for (auto r : kAllRarities) {
        if (box.table.Contains(r) && box.CandidatesOf(r).empty()) {
            return GameResult<BoxId>::err(GameError(
                ErrorCode::InvalidArgument,
                "loot box " + std::to_string(box.id.value()) + " has no " +
                    std::string(rarityName(r)) + " candidates"));
        }
    }
    if (boxes_.contains(box.id)) {
        return GameResult<BoxId>::err(GameError(
            ErrorCode::AlreadyExists,
            "loot box " + std::to_string(box.id.value()) + " is already in the pool"));
    }

    const auto id = box.id;
    // Keep allocation monotonic when a caller supplied its own id.
    nextBoxId_ = std::max(nextBoxId_, id.value() + 1);
    boxes_.emplace(id, std::move(box));
    ++inserted_;
    return GameResult<BoxId>::ok(id);
}

const LootBox* LootBoxPool::Find(BoxId id) const {
    if (auto it = boxes_.find(id); it != boxes_.end()) {
        return &it->second;
    }
    return nullptr;
}

std::optional<BoxId> LootBoxPool::FirstId() const {
    if (boxes_.empty()) {
        return std::nullopt;
    }
    return boxes_.begin()->first;
}

std::optional<LootBox> LootBoxPool::Extract(BoxId id) {
    auto node = boxes_.extract(id);
    if (node.empty()) {
        return std::nullopt;
    }
    ++extracted_;
    return std::move(node.mapped());
}

// -- Generation ---------------------------------------------------------------

namespace {

/// Up to @p count distinct entries of @p pool, in draw order (partial Fisher-Yates).
std::vector<ItemTemplate> sampleTemplates(const std::vector<const ItemTemplate*>& pool,
                                          std::size_t count, RandomSource& rng) {
    std::vector<std::size_t> order(pool.size());
    std::iota(order.begin(), order.end(), std::size_t{0});

    const std::size_t picks = std::min(count, order.size());
    std::vector<ItemTemplate> chosen;
    chosen.reserve(picks);
    for (std::size_t i = 0; i < picks; ++i) {
        const std::size_t j = i + rng.NextIndex(order.size() - i);
        std::swap(order[i], order[j]);
        chosen.push_back(*pool[order[i]]);
    }
    return chosen;
}

} // namespace

GameResult<LootBox> GenerateLootBox(BoxId id, const ItemCatalog& catalog,
                                    BoxDistribution distribution, std::size_t templatesPerTier,
                                    const RarityTable& base, RandomSource& rng) {
    if (catalog.Empty()) {
        return GameResult<LootBox>::err(
            GameError(ErrorCode::CatalogEmpty, "item catalog has no templates"));
    }
    if (templatesPerTier == 0) {
        return GameResult<LootBox>::err(
            GameError(ErrorCode::InvalidArgument, "templates per tier must be at least 1"));
    }

    auto effective = distribution;
    if (effective == BoxDistribution::Mixed) {
        effective = rng.NextBool() ? BoxDistribution::Uniform : BoxDistribution::Skewed;
    }

    LootBox box;
    box.id = id;
    box.distribution = effective;

    for (auto r : kAllRarities) {
        const auto& templates = catalog.TemplatesOf(r);
        if (templates.empty()) {
            continue;
        }
        if (effective == BoxDistribution::Skewed && !base.Contains(r)) {
            continue;
        }

        box.candidates[rarityIndex(r)] = sampleTemplates(templates, templatesPerTier, rng);
        const double weight = effective == BoxDistribution::Uniform ? 1.0 : base.Weight(r);
        // weight > 0 holds for both branches.
        (void)box.table.SetWeight(r, weight);
    }

    if (box.table.Empty()) {
        return GameResult<LootBox>::err(GameError(
            ErrorCode::CatalogEmpty, "no catalog tier matches the rarity table"));
    }
    return GameResult<LootBox>::ok(std::move(box));
}

GameResult<std::size_t> GenerateBoxes(LootBoxPool& pool, std::size_t count,
                                      const ItemCatalog& catalog, BoxDistribution distribution,
                                      std::size_t templatesPerTier, const RarityTable& base,
                                      RandomSource& rng) {
    if (count > 0 && pool.IsFull()) {
        return GameResult<std::size_t>::err(GameError(
            ErrorCode::PoolAtCapacity,
            "loot box pool is full (" + std::to_string(pool.Capacity()) + " boxes)"));
    }

    const std::size_t target = std::min(count, pool.FreeSlots());
    std::size_t generated = 0;
    while (generated < target) {
        auto box = GenerateLootBox(pool.AllocateBoxId(), catalog, distribution,
                                   templatesPerTier, base, rng);
        if (!box) {
            return GameResult<std::size_t>::err(box.error());
        }

        const auto& made = box.value();
        LogContext ctx;
        ctx.boxId = made.id;
        ctx.extra["distribution"] = std::string(boxDistributionName(made.distribution));
        ctx.extra["candidates"] = std::to_string(made.CandidateCount());
        LBX_LOG_CTX(LogLevel::Debug, LogCategory::Loot, "Generated loot box", ctx);

        auto inserted = pool.Insert(std::move(box).value());
        if (!inserted) {
            return GameResult<std::size_t>::err(inserted.error());
        }
        ++generated;
    }
    return GameResult<std::size_t>::ok(generated);
}

}  // namespace lbx::game
