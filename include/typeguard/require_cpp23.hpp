#pragma once

/**
 * @file require_cpp23.hpp
 * @brief C++23 feature-test checks for typeguard
 *
 * Verifies at compile time that the standard library provides the C++23
 * features typeguard relies on. Included by the command-line driver and by
 * the core translation units so an insufficient toolchain fails early with
 * a readable message.
 *
 * Required compiler versions:
 *   - GCC 14.0+
 *   - Clang 19.0+
 */

#include <expected>
#include <version>

#if !defined(__cplusplus) || __cplusplus < 202'302L
    #error "typeguard requires C++23 or later (__cplusplus >= 202302L)."
#endif

// Console output of the command-line driver
#if !defined(__cpp_lib_print) || __cpp_lib_print < 202'207L
    #error "typeguard requires std::print/std::println (__cpp_lib_print >= 202207L)."
#endif

// Error handling: construction errors travel as std::expected
#if !defined(__cpp_lib_expected) || __cpp_lib_expected < 202'202L
    #error "typeguard requires std::expected (__cpp_lib_expected >= 202202L)."
#endif

// Indexed iteration over arrays and tuple positions
#if !defined(__cpp_lib_ranges_enumerate) || __cpp_lib_ranges_enumerate < 202'302L
    #error "typeguard requires std::views::enumerate (__cpp_lib_ranges_enumerate >= 202302L)."
#endif

// Message rendering
#if !defined(__cpp_lib_format) || __cpp_lib_format < 202'110L
    #error "typeguard requires std::format (__cpp_lib_format >= 202110L)."
#endif

#if !defined(__cpp_lib_ranges) || __cpp_lib_ranges < 202'110L
    #error "typeguard requires std::ranges (__cpp_lib_ranges >= 202110L)."
#endif

// SHA-256 fingerprints
#if !defined(__cpp_lib_byteswap) || __cpp_lib_byteswap < 202'110L
    #error "typeguard requires std::byteswap (__cpp_lib_byteswap >= 202110L)."
#endif

#define TYPEGUARD_CPP23_FEATURES_VERIFIED 1
