#pragma once

/// @file plugin_types.hpp
/// @brief Core plugin types: Version, PluginInfo, PluginState, PluginContext.

#include <cstdint>
#include <string>
#include <vector>

#include "lbx/foundation/service_locator.hpp"

namespace lbx::plugin {

class EventBus;

/// Plugin API version a plugin was built against.
constexpr uint32_t kPluginApiVersion = 1;

/// Semantic version for plugins.
struct Version {
    uint16_t major = 0;
    uint16_t minor = 0;
    uint16_t patch = 0;

    /// Compatible when the major versions match.
    [[nodiscard]] bool IsCompatibleWith(const Version& other) const noexcept {
        return major == other.major;
    }

    auto operator<=>(const Version&) const = default;
};

/// Metadata describing a plugin.
struct PluginInfo {
    std::string name;
    std::string description;
    Version version;
    std::vector<std::string> dependencies;
    uint32_t apiVersion = kPluginApiVersion;
};

/// Runtime context handed to a plugin in OnLoad().
///
/// Both pointers are owned by the host and outlive the plugin.  Either may
/// be null: a plugin falls back to defaults without services and skips
/// notifications without an event bus.
struct PluginContext {
    lbx::foundation::ServiceLocator* services = nullptr;
    EventBus* eventBus = nullptr;
};

/// Plugin lifecycle states.
///
///   Unloaded --OnLoad--> Loaded --OnInit--> Active --OnShutdown--> Unloaded
///                   \________________ on failure ________________> Error
enum class PluginState : uint8_t {
    Unloaded,  ///< Initial state, and again after OnShutdown().
    Loaded,    ///< OnLoad() succeeded.
    Active,    ///< OnInit() succeeded; receives OnUpdate() calls.
    Error      ///< A lifecycle transition failed.
};

} // namespace lbx::plugin
