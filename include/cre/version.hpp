#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define CRE_VERSION_MAJOR 0
#define CRE_VERSION_MINOR 3
#define CRE_VERSION_PATCH 0
#define CRE_VERSION_STRING "0.3.0"

namespace cre {

/// Combat resolution engine version at compile time.
struct Version {
    static constexpr int major = CRE_VERSION_MAJOR;
    static constexpr int minor = CRE_VERSION_MINOR;
    static constexpr int patch = CRE_VERSION_PATCH;
    static constexpr const char* string = CRE_VERSION_STRING;
};

} // namespace cre
