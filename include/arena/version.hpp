#pragma once

/// @file version.hpp
/// @brief Library version.

#define ARENA_VERSION_MAJOR 0
#define ARENA_VERSION_MINOR 1
#define ARENA_VERSION_PATCH 0
#define ARENA_VERSION_STRING "0.1.0"

namespace arena {

struct Version {
    static constexpr int major = ARENA_VERSION_MAJOR;
    static constexpr int minor = ARENA_VERSION_MINOR;
    static constexpr int patch = ARENA_VERSION_PATCH;
    static constexpr const char* string = ARENA_VERSION_STRING;
};

}  // namespace arena
