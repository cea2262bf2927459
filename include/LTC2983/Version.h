/// @file Version.h
/// @brief Version information
/// @note Keep in sync with library.json
#pragma once

namespace LTC2983 {

/// Library version string
static constexpr const char* VERSION = "0.1.0";

/// Version components
static constexpr int VERSION_MAJOR = 0;
static constexpr int VERSION_MINOR = 1;
static constexpr int VERSION_PATCH = 0;

/// Version as single integer (major * 10000 + minor * 100 + patch)
static constexpr int VERSION_INT = 100;

} // namespace LTC2983
