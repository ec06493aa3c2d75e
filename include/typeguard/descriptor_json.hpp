#pragma once

/**
 * @file descriptor_json.hpp
 * @brief Descriptor documents: the JSON form produced by extraction tools
 *
 * Document layout (typeguard.descriptor.v1):
 * @code
 * {
 *   "schema_version": "typeguard.descriptor.v1",
 *   "definitions": { "List": { "parameters": ["T"], "type": { ... } } },
 *   "root": { "kind": "instantiate", "base": "List", "arguments": [{ "kind": "string" }] }
 * }
 * @endcode
 */

#include "typeguard/common.hpp"
#include "typeguard/config.hpp"
#include "typeguard/descriptor.hpp"
#include "typeguard/normalizer.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace typeguard {

struct TypeDocument
{
    TypeRegistry registry;
    DescriptorPtr root;
};

/**
 * Parse one type node.
 * @param policy Handling of "function" and "class" nodes
 * @return MalformedDescriptor on structural errors, UnsupportedType for
 *         opaque types under the reject policy
 */
[[nodiscard]] typeguard::Result<DescriptorPtr>
descriptor_from_json(const nlohmann::json& node,
                     config::OpaqueTypePolicy policy = config::OpaqueTypePolicy::kReject);

/// Serialize a descriptor back to its type-node form.
[[nodiscard]] nlohmann::json descriptor_to_json(const Descriptor& descriptor);

[[nodiscard]] typeguard::Result<TypeDocument>
load_type_document(const nlohmann::json& document,
                   config::OpaqueTypePolicy policy = config::OpaqueTypePolicy::kReject);

/**
 * Read a descriptor document, validate it against descriptor.v1.schema.json
 * from schema_dir, then parse it.
 */
[[nodiscard]] typeguard::Result<TypeDocument>
load_type_document_file(const std::string& path,
                        const std::string& schema_dir,
                        config::OpaqueTypePolicy policy = config::OpaqueTypePolicy::kReject);

/// {"fingerprint", "root", "definitions"} for a normalized type.
[[nodiscard]] nlohmann::json normalized_to_json(const NormalizedType& type);

}  // namespace typeguard
