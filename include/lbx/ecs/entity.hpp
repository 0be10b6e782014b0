#pragma once

/// @file entity.hpp
/// @brief Entity handle for the ECS layer.
///
/// An entity is a 32-bit handle: a 24-bit slot index and an 8-bit
/// generation.  The generation changes every time a slot is recycled so
/// stale handles to destroyed players, requests or events can be told
/// apart from the live entity that now occupies the slot.

#include <cstdint>
#include <functional>
#include <limits>

namespace lbx::ecs {

struct Entity {
    uint32_t raw = kInvalidRaw;

    static constexpr uint32_t kIdBits = 24;
    static constexpr uint32_t kIdMask = (1u << kIdBits) - 1;
    static constexpr uint32_t kVersionShift = kIdBits;
    static constexpr uint32_t kInvalidRaw = std::numeric_limits<uint32_t>::max();
    static constexpr uint32_t kMaxId = kIdMask - 1;  // kIdMask is reserved for the sentinel.

    constexpr Entity() = default;

    constexpr Entity(uint32_t id, uint8_t version)
        : raw((static_cast<uint32_t>(version) << kVersionShift) | (id & kIdMask)) {}

    /// Slot index, used to address component storages.
    [[nodiscard]] constexpr uint32_t id() const noexcept { return raw & kIdMask; }

    /// Generation of the slot at the time this handle was issued.
    [[nodiscard]] constexpr uint8_t version() const noexcept {
        return static_cast<uint8_t>(raw >> kVersionShift);
    }

    [[nodiscard]] constexpr bool isValid() const noexcept { return raw != kInvalidRaw; }

    [[nodiscard]] static constexpr Entity invalid() noexcept { return Entity{}; }

    constexpr auto operator<=>(const Entity&) const = default;
};

static_assert(sizeof(Entity) == 4, "Entity must be exactly 32 bits");

} // namespace lbx::ecs

template <>
struct std::hash<lbx::ecs::Entity> {
    std::size_t operator()(const lbx::ecs::Entity& e) const noexcept {
        return std::hash<uint32_t>{}(e.raw);
    }
};
