#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define LBX_VERSION_MAJOR 0
#define LBX_VERSION_MINOR 3
#define LBX_VERSION_PATCH 0
#define LBX_VERSION_STRING "0.3.0"

namespace lbx {

/// Project version information at compile time.
struct Version {
    static constexpr int major = LBX_VERSION_MAJOR;
    static constexpr int minor = LBX_VERSION_MINOR;
    static constexpr int patch = LBX_VERSION_PATCH;
    static constexpr const char* string = LBX_VERSION_STRING;
};

} // namespace lbx
