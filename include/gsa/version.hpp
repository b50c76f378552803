#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define GSA_VERSION_MAJOR 0
#define GSA_VERSION_MINOR 3
#define GSA_VERSION_PATCH 1
#define GSA_VERSION_STRING "0.3.1"

namespace gsa {

/// Agent version information at compile time.
struct Version {
    static constexpr int major = GSA_VERSION_MAJOR;
    static constexpr int minor = GSA_VERSION_MINOR;
    static constexpr int patch = GSA_VERSION_PATCH;
    static constexpr const char* string = GSA_VERSION_STRING;
};

} // namespace gsa
