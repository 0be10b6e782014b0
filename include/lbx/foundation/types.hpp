#pragma once

/// @file types.hpp
/// @brief Strong ID types shared by the game modules.

#include <cstdint>
#include <functional>

namespace lbx::foundation {

/// Tag-based strong typedef for ID values.
///
/// Keeps PlayerId, BoxId and ItemInstanceId from being mixed up while
/// sharing the same integral representation.  Value 0 is the null ID.
template <typename Tag, typename T = uint64_t>
class StrongId {
public:
    constexpr StrongId() = default;
    constexpr explicit StrongId(T value) : value_(value) {}

    [[nodiscard]] constexpr T value() const noexcept { return value_; }
    [[nodiscard]] constexpr bool isValid() const noexcept { return value_ != 0; }

    constexpr auto operator<=>(const StrongId&) const = default;

private:
    T value_ = 0;
};

struct PlayerIdTag {};
struct BoxIdTag {};
struct ItemInstanceIdTag {};

/// Identifier of a player profile.
using PlayerId = StrongId<PlayerIdTag>;

/// Identifier of a loot box in the pool.
using BoxId = StrongId<BoxIdTag>;

/// Identifier of a concrete item instance (unique per opened box).
using ItemInstanceId = StrongId<ItemInstanceIdTag>;

} // namespace lbx::foundation

template <typename Tag, typename T>
struct std::hash<lbx::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const lbx::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
