#pragma once

/**
 * @file schema_validate.hpp
 * @brief JSON Schema validation of descriptor and configuration documents
 */

#include "typeguard/common.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace typeguard::common {

/**
 * Validate JSON against a JSON Schema file.
 *
 * Schemas may reference siblings through "typeguard:schema/<name>" URIs,
 * resolved to "<name>.schema.json" next to the schema file.
 *
 * @param j JSON document to validate
 * @param schema_path Path to JSON Schema file
 * @return Empty on success, error on failure
 */
[[nodiscard]] typeguard::VoidResult validate_json(const nlohmann::json& j,
                                                  const std::string& schema_path);

}  // namespace typeguard::common
