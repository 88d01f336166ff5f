/**
 * @file Version.h
 * @brief Library version information
 */

#pragma once

#include <stdint.h>

namespace RX8010SJ {

static constexpr uint8_t VERSION_MAJOR = 1;
static constexpr uint8_t VERSION_MINOR = 0;
static constexpr uint8_t VERSION_PATCH = 0;

/// @brief Semantic version string
static constexpr const char* VERSION = "1.0.0";

/// @brief Version with library name
static constexpr const char* VERSION_FULL = "RX8010SJ 1.0.0";

/// @brief Build timestamp of the translation unit including this header
static constexpr const char* BUILD_TIMESTAMP = __DATE__ " " __TIME__;

}  // namespace RX8010SJ
