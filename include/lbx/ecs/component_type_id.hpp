#pragma once

/// @file component_type_id.hpp
/// @brief RTTI-free runtime identifiers for component and system types.

#include <atomic>
#include <cstdint>

namespace lbx::ecs {

using ComponentTypeId = uint32_t;

constexpr ComponentTypeId kInvalidComponentTypeId = static_cast<ComponentTypeId>(-1);

namespace detail {

inline ComponentTypeId nextComponentTypeId() noexcept {
    static std::atomic<ComponentTypeId> counter{0};
    return counter.fetch_add(1, std::memory_order_relaxed);
}

} // namespace detail

/// Unique id for component type `T`, assigned lazily on first use.
///
/// Values are stable for the lifetime of the process but depend on the
/// order of first use, so they must never be persisted.
///
/// @code
///   auto id = ComponentType<Inventory>::Id();
/// @endcode
template <typename T>
struct ComponentType {
    static ComponentTypeId Id() noexcept {
        static const ComponentTypeId value = detail::nextComponentTypeId();
        return value;
    }
};

} // namespace lbx::ecs
