#pragma once

/// @file loot_events.hpp
/// @brief Request and event components, plus the presentation notification feed.
///
/// Player intents and in-frame consequences travel as components on
/// short-lived entities.  A system sets `processed` once it has handled
/// one; the plugin destroys processed entities at the end of the frame.

#include "lbx/ecs/entity.hpp"
#include "lbx/foundation/error_code.hpp"
#include "lbx/foundation/types.hpp"
#include "lbx/game/item_types.hpp"
#include "lbx/game/loot_operations.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lbx::game {

// -- Requests -----------------------------------------------------------------

/// Intent to open a box.  BoxChoiceSystem fills `chosen`; BoxOpeningSystem
/// opens it.
struct OpenBoxRequest {
    lbx::ecs::Entity player;
    BoxSelection selection;
    std::optional<foundation::BoxId> chosen;
    bool processed = false;
};

/// Intent to equip an owned item.
struct EquipRequest {
    lbx::ecs::Entity player;
    foundation::ItemInstanceId item;
    bool processed = false;
};

/// Intent to sell an owned item.
struct SellRequest {
    lbx::ecs::Entity player;
    foundation::ItemInstanceId item;
    bool processed = false;
};

// -- In-frame events ----------------------------------------------------------

/// A player received an item.  Carries a copy so a same-frame sale does not
/// change the experience it is worth.
struct ItemAcquiredEvent {
    lbx::ecs::Entity player;
    Item item;
    bool processed = false;
};

/// A player's level rose during the frame (at most one per player per frame).
struct LevelUpEvent {
    lbx::ecs::Entity player;
    uint32_t fromLevel = 1;
    uint32_t toLevel = 1;
    bool processed = false;
};

// -- Presentation notifications -----------------------------------------------

enum class NotificationKind : uint8_t {
    BoxGenerated,
    BoxOpened,
    ItemEquipped,
    ItemSold,
    LevelUp,
    ActionFailed
};

[[nodiscard]] constexpr std::string_view notificationKindName(NotificationKind kind) noexcept {
    switch (kind) {
        case NotificationKind::BoxGenerated: return "BoxGenerated";
        case NotificationKind::BoxOpened:    return "BoxOpened";
        case NotificationKind::ItemEquipped: return "ItemEquipped";
        case NotificationKind::ItemSold:     return "ItemSold";
        case NotificationKind::LevelUp:      return "LevelUp";
        case NotificationKind::ActionFailed: return "ActionFailed";
    }
    return "Unknown";
}

/// What the presentation layer is told after each frame.
///
/// `player` is null for world-level notices such as BoxGenerated.
struct LootNotification {
    foundation::PlayerId player;
    NotificationKind kind = NotificationKind::ActionFailed;
    foundation::ErrorCode code = foundation::ErrorCode::Success;
    std::string message;
};

/// Frame-scoped queue of notifications, drained by the plugin.
class LootFeed {
public:
    void Push(LootNotification notice) { pending_.push_back(std::move(notice)); }

    void Push(foundation::PlayerId player, NotificationKind kind, std::string message,
              foundation::ErrorCode code = foundation::ErrorCode::Success) {
        pending_.push_back(LootNotification{player, kind, code, std::move(message)});
    }

    /// Hand over everything queued so far and start empty.
    [[nodiscard]] std::vector<LootNotification> Drain() {
        std::vector<LootNotification> out;
        out.swap(pending_);
        return out;
    }

    [[nodiscard]] const std::vector<LootNotification>& Pending() const noexcept { return pending_; }
    [[nodiscard]] std::size_t Size() const noexcept { return pending_.size(); }

private:
    std::vector<LootNotification> pending_;
};

}  // namespace lbx::game
