#pragma once

/// @file iplugin.hpp
/// @brief IPlugin abstract interface.

#include "lbx/plugin/plugin_types.hpp"

namespace lbx::plugin {

/// Abstract base class for gameplay plugins.
///
/// The host drives the lifecycle callbacks in order:
///
///   OnLoad() -> OnInit() -> OnUpdate()* -> OnShutdown() -> OnUnload()
class IPlugin {
public:
    virtual ~IPlugin() = default;

    [[nodiscard]] virtual const PluginInfo& GetInfo() const = 0;

    /// Acquire configuration and services.
    /// @return false to abort loading.
    virtual bool OnLoad(PluginContext& ctx) = 0;

    /// Register systems and build the execution plan.
    /// @return false to abort initialization.
    virtual bool OnInit() = 0;

    /// Run one frame.
    ///
    /// @param deltaTime  Frame delta time in seconds.
    virtual void OnUpdate(float deltaTime) = 0;

    /// Release world state built in OnInit().
    virtual void OnShutdown() = 0;

    /// Final cleanup before the plugin object is destroyed.
    virtual void OnUnload() = 0;
};

}  // namespace lbx::plugin
