#pragma once

/**
 * @file canonical_json.hpp
 * @brief Canonical JSON serialization for descriptor fingerprints
 *
 * Rules:
 * - Object keys in lexicographic order
 * - No whitespace (minimal representation)
 * - Floats with an integral value are written as integers, so 1 and 1.0
 *   canonicalize identically
 * - NaN and infinities are rejected
 */

#include "typeguard/common.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace typeguard::canonical {

/**
 * Serialize JSON to canonical form
 * @param j JSON value
 * @return Canonical byte string or error
 */
[[nodiscard]] typeguard::Result<std::string> canonicalize(const nlohmann::json& j);

/**
 * Compute SHA-256 hash of canonical JSON
 * @param j JSON value
 * @return "sha256:" + hex hash or error
 */
[[nodiscard]] typeguard::Result<std::string> hash_canonical(const nlohmann::json& j);

/**
 * Fold integral floats into integers, recursively
 * @param j JSON value
 * @return Copy with numbers in canonical representation
 */
[[nodiscard]] nlohmann::json canonical_numbers(const nlohmann::json& j);

/**
 * Validate JSON for canonical form requirements
 * - Only finite numbers
 * @param j JSON value
 * @return Empty on success, error on failure
 */
[[nodiscard]] typeguard::VoidResult validate_for_canonical(const nlohmann::json& j);

}  // namespace typeguard::canonical
