#pragma once

/**
 * @file version.hpp
 * @brief typeguard version information
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */

namespace typeguard {

/// typeguard version string
constexpr const char* kVersion = "0.1.0";

/// Build identifier
constexpr const char* kBuildId = "dev";

/// Version tag of descriptor documents accepted by the loader
constexpr const char* kDescriptorSchemaVersion = "typeguard.descriptor.v1";

/// Version tag of configuration documents
constexpr const char* kConfigSchemaVersion = "typeguard.config.v1";

}  // namespace typeguard
