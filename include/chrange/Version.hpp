#pragma once

#define CHRANGE_VERSION_MAJOR 0
#define CHRANGE_VERSION_MINOR 1
#define CHRANGE_VERSION_PATCH 0

#define CHRANGE_VERSION_HEX ((CHRANGE_VERSION_MAJOR<<16) | (CHRANGE_VERSION_MINOR<<8) | (CHRANGE_VERSION_PATCH))

namespace chrange {
inline constexpr int version_major = CHRANGE_VERSION_MAJOR;
inline constexpr int version_minor = CHRANGE_VERSION_MINOR;
inline constexpr int version_patch = CHRANGE_VERSION_PATCH;
} // namespace chrange
