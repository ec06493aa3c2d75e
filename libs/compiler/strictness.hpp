#pragma once

/**
 * @file strictness.hpp
 * @brief Closed-object checks for equality-mode validation
 */

#include "typeguard/context.hpp"
#include "typeguard/descriptor.hpp"

#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace typeguard::strictness {

using KeySet = std::set<std::string, std::less<>>;

/// Keys an object descriptor accounts for.
struct ObjectShape
{
    KeySet declared;
    std::optional<IndexKeyKind> index;

    [[nodiscard]] bool covers(std::string_view key) const;
};

[[nodiscard]] ObjectShape shape_of(const ObjectType& object);

/**
 * Own keys of an object value that neither the shape nor an enclosing
 * intersection accounts for, in key order.
 * @param all Collect every key instead of stopping at the first
 */
[[nodiscard]] std::vector<std::string> superfluous_keys(const nlohmann::json& value,
                                                        const ObjectShape& shape,
                                                        const ValidationContext& context,
                                                        bool all);

/**
 * Keys declared by the object-shaped members of an intersection, looking
 * through references, nested intersections and unions.
 */
[[nodiscard]] KeySet declared_keys(const std::vector<DescriptorPtr>& members,
                                   const std::map<std::string, DescriptorPtr>& definitions);

/**
 * Per intersection member, the keys declared by the other members.
 *
 * A member never receives its own keys: a union member must account for a
 * key through the alternative it matched, not through a sibling alternative.
 */
[[nodiscard]] std::vector<KeySet>
allowed_keys(const std::vector<DescriptorPtr>& members,
             const std::map<std::string, DescriptorPtr>& definitions);

}  // namespace typeguard::strictness
