#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the loot-box runtime.

#include <cstdint>
#include <string_view>

namespace lbx::foundation {

/// Error codes grouped by subsystem in 0x100-wide ranges, so the source
/// of an error can be read from its value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,

    // ECS (0x0300 - 0x03FF)
    EntityNotFound = 0x0300,
    ComponentNotFound = 0x0301,
    SystemError = 0x0302,

    // Plugin (0x0400 - 0x04FF)
    PluginInitFailed = 0x0400,
    PluginNotLoaded = 0x0401,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,
    ConfigInvalidValue = 0x0603,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerFlushFailed = 0x0801,

    // Loot (0x0900 - 0x09FF)
    BoxNotFound = 0x0900,
    PoolEmpty = 0x0901,
    PoolAtCapacity = 0x0902,
    CatalogEmpty = 0x0903,

    // Inventory (0x0A00 - 0x0AFF)
    ItemNotInInventory = 0x0A00,
    PlayerNotFound = 0x0A01,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto category = static_cast<uint32_t>(code) & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0300: return "ECS";
        case 0x0400: return "Plugin";
        case 0x0600: return "Config";
        case 0x0800: return "Logger";
        case 0x0900: return "Loot";
        case 0x0A00: return "Inventory";
        default: return "Unknown";
    }
}

/// Short identifier for an error code, used in log lines and notifications.
constexpr std::string_view errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::EntityNotFound: return "EntityNotFound";
        case ErrorCode::ComponentNotFound: return "ComponentNotFound";
        case ErrorCode::SystemError: return "SystemError";
        case ErrorCode::PluginInitFailed: return "PluginInitFailed";
        case ErrorCode::PluginNotLoaded: return "PluginNotLoaded";
        case ErrorCode::ConfigLoadFailed: return "ConfigLoadFailed";
        case ErrorCode::ConfigKeyNotFound: return "ConfigKeyNotFound";
        case ErrorCode::ConfigTypeMismatch: return "ConfigTypeMismatch";
        case ErrorCode::ConfigInvalidValue: return "ConfigInvalidValue";
        case ErrorCode::LoggerError: return "LoggerError";
        case ErrorCode::LoggerFlushFailed: return "LoggerFlushFailed";
        case ErrorCode::BoxNotFound: return "BoxNotFound";
        case ErrorCode::PoolEmpty: return "PoolEmpty";
        case ErrorCode::PoolAtCapacity: return "PoolAtCapacity";
        case ErrorCode::CatalogEmpty: return "CatalogEmpty";
        case ErrorCode::ItemNotInInventory: return "ItemNotInInventory";
        case ErrorCode::PlayerNotFound: return "PlayerNotFound";
    }
    return "Unknown";
}

} // namespace lbx::foundation
