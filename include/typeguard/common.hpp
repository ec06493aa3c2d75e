#pragma once

/**
 * @file common.hpp
 * @brief Common utilities: error type, result aliases, hashing
 */

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace typeguard {

/**
 * @brief Error information for Result types
 */
struct Error
{
    std::string code;     ///< Machine-readable error code
    std::string message;  ///< Human-readable error message

    [[nodiscard]] static Error make(std::string code, std::string message)
    {
        return Error{.code = std::move(code), .message = std::move(message)};
    }
};

/**
 * @brief Result type using std::expected (C++23)
 * @tparam T Success value type
 */
template <typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Result type for void success using std::expected (C++23)
 */
using VoidResult = std::expected<void, Error>;

/**
 * Error codes carried in Error::code.
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */
namespace errc {

/// Descriptor graph violates a construction invariant (programmer error)
constexpr const char* kMalformedDescriptor = "MalformedDescriptor";
/// A generic parameter is still free after substitution
constexpr const char* kUnboundTypeParameter = "UnboundTypeParameter";
/// A definition reaches itself without a structural step in between
constexpr const char* kCyclicWithoutReference = "CyclicWithoutReference";
/// A reference names nothing in the registry
constexpr const char* kUnresolvedReference = "UnresolvedReference";
/// Generic expansion does not close
constexpr const char* kInstantiationTooDeep = "InstantiationTooDeep";
/// Function or class type rejected at the extraction boundary
constexpr const char* kUnsupportedType = "UnsupportedType";
constexpr const char* kNonFiniteNumber = "NonFiniteNumber";
constexpr const char* kIoError = "IOError";
constexpr const char* kParseError = "ParseError";
constexpr const char* kSchemaInvalid = "SchemaInvalid";
constexpr const char* kInvalidConfig = "InvalidConfig";
/// Command-line option given without its value
constexpr const char* kMissingArgument = "MissingArgument";
/// Unknown command-line option
constexpr const char* kInvalidArgument = "InvalidArgument";

}  // namespace errc

}  // namespace typeguard

namespace typeguard::common {

// ============================================================================
// SHA-256 Hash
// ============================================================================

/**
 * Compute SHA-256 hash of data
 * @param data Input bytes
 * @return Hex-encoded hash string (64 characters)
 */
[[nodiscard]] std::string sha256(std::string_view data);

/**
 * Compute SHA-256 hash of data with prefix
 * @param data Input bytes
 * @return "sha256:" + hex-encoded hash
 */
[[nodiscard]] std::string sha256_prefixed(std::string_view data);

}  // namespace typeguard::common
