#pragma once
/**
 * @file version.hpp
 * @brief Release identifier for the blesniff decoder.
 *
 * The version is a compile-time constant. It never changes while a process runs,
 * so any thread may query it at any time without synchronization.
 */

#define BLESNIFF_VERSION_MAJOR 1
#define BLESNIFF_VERSION_MINOR 1
#define BLESNIFF_VERSION_PATCH 0
#define BLESNIFF_VERSION "1.1.0"

namespace blesniff {

/// Decoder release version, e.g. "1.1.0".
inline const char* version() { return BLESNIFF_VERSION; }

} // namespace blesniff
