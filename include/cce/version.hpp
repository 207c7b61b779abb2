#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define CCE_VERSION_MAJOR 0
#define CCE_VERSION_MINOR 1
#define CCE_VERSION_PATCH 0
#define CCE_VERSION_STRING "0.1.0"

namespace cce {

/// Project version information at compile time.
struct Version {
    static constexpr int major = CCE_VERSION_MAJOR;
    static constexpr int minor = CCE_VERSION_MINOR;
    static constexpr int patch = CCE_VERSION_PATCH;
    static constexpr const char* string = CCE_VERSION_STRING;
};

} // namespace cce
