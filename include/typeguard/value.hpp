#pragma once

/**
 * @file value.hpp
 * @brief Runtime kinds of untyped values
 *
 * Values are nlohmann::json documents. Two kinds have no JSON literal:
 * - undefined: a discarded value, also standing for an absent property
 * - bigint: a binary value tagged with a CBOR bignum subtype (2 = positive,
 *   3 = negative), as produced by nlohmann::json::from_cbor when tags are
 *   stored
 */

#include <cstdint>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace typeguard {

enum class ValueKind {
    kUndefined,
    kNull,
    kBoolean,
    kNumber,
    kString,
    kBigInt,
    kBinary,
    kArray,
    kObject
};

/// CBOR tag numbers for unsigned and negative bignums.
constexpr std::uint64_t kBigIntPositiveSubtype = 2;
constexpr std::uint64_t kBigIntNegativeSubtype = 3;

[[nodiscard]] ValueKind value_kind(const nlohmann::json& value) noexcept;

[[nodiscard]] std::string_view to_string(ValueKind kind) noexcept;

[[nodiscard]] bool is_bigint(const nlohmann::json& value) noexcept;

/// Shared discarded value used for absent properties.
[[nodiscard]] const nlohmann::json& undefined_value() noexcept;

/**
 * @brief Build a bigint value from its big-endian magnitude
 * @param magnitude Big-endian magnitude bytes
 * @param negative Sign; CBOR encodes -1 - n for negative bignums
 */
[[nodiscard]] nlohmann::json make_bigint(std::vector<std::uint8_t> magnitude,
                                         bool negative = false);

/// True for keys that spell a finite number, the keys a number index signature covers.
[[nodiscard]] bool is_numeric_key(std::string_view key) noexcept;

}  // namespace typeguard
