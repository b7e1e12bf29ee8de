#pragma once

/**
 * @file require_cpp23.hpp
 * @brief C++23 feature-test checks for OSS-Sensor
 *
 * Verifies at compile time that the standard library provides the C++23
 * features the pipeline relies on. Formatting and console output go through
 * {fmt}/spdlog, so <format> and <print> are not required.
 *
 * Required compiler versions:
 *   - GCC 12.0+
 *   - Clang 16.0+ (with libstdc++ 12 or newer)
 */

#include <expected>
#include <version>

// =============================================================================
// C++23 Language Standard Check
// =============================================================================

#if !defined(__cplusplus) || __cplusplus <= 202'002L
    #error "OSS-Sensor requires C++23 (compile with -std=c++23 or -std=c++2b)."
#endif

// =============================================================================
// std::expected (__cpp_lib_expected)
// =============================================================================
// Required for: Result<T> error handling

#if !defined(__cpp_lib_expected) || __cpp_lib_expected < 202'202L
    #error "OSS-Sensor requires std::expected (__cpp_lib_expected >= 202202L)."
#endif

// =============================================================================
// std::rotl / std::rotr (__cpp_lib_bitops)
// =============================================================================
// Required for: SHA-256 rounds

#if !defined(__cpp_lib_bitops) || __cpp_lib_bitops < 201'907L
    #error "OSS-Sensor requires <bit> bit operations (__cpp_lib_bitops >= 201907L)."
#endif

// =============================================================================
// std::byteswap (__cpp_lib_byteswap)
// =============================================================================
// Required for: SHA-256 schedule and foreign-endian ELF / Mach-O fields

#if !defined(__cpp_lib_byteswap) || __cpp_lib_byteswap < 202'110L
    #error "OSS-Sensor requires std::byteswap (__cpp_lib_byteswap >= 202110L)."
#endif

// =============================================================================
// std::to_underlying (__cpp_lib_to_underlying)
// =============================================================================

#if !defined(__cpp_lib_to_underlying) || __cpp_lib_to_underlying < 202'102L
    #error "OSS-Sensor requires std::to_underlying (__cpp_lib_to_underlying >= 202102L)."
#endif

// =============================================================================
// std::ranges (__cpp_lib_ranges)
// =============================================================================

#if !defined(__cpp_lib_ranges) || __cpp_lib_ranges < 202'106L
    #error "OSS-Sensor requires std::ranges (__cpp_lib_ranges >= 202106L)."
#endif

#define OSSENSOR_CPP23_FEATURES_VERIFIED 1
