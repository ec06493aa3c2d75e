/**
 * @file strictness.cpp
 * @brief Superfluous-property detection
 */

#include "strictness.hpp"

#include "typeguard/value.hpp"

namespace typeguard::strictness {

namespace {

void collect_keys(const DescriptorPtr& node,
                  const std::map<std::string, DescriptorPtr>& definitions,
                  std::set<std::string>& visited,
                  KeySet& keys)
{
    if (const auto* object = node->as<ObjectType>()) {
        for (const auto& property : object->properties) {
            keys.insert(property.name);
        }
        return;
    }
    if (const auto* reference = node->as<ReferenceType>()) {
        const auto it = definitions.find(reference->target);
        if (it != definitions.end() && visited.insert(reference->target).second) {
            collect_keys(it->second, definitions, visited, keys);
        }
        return;
    }
    if (const auto* intersection = node->as<IntersectionType>()) {
        for (const auto& member : intersection->members) {
            collect_keys(member, definitions, visited, keys);
        }
        return;
    }
    if (const auto* alternatives = node->as<UnionType>()) {
        for (const auto& member : alternatives->members) {
            collect_keys(member, definitions, visited, keys);
        }
    }
}

}  // namespace

bool ObjectShape::covers(std::string_view key) const
{
    if (declared.contains(key)) {
        return true;
    }
    if (!index) {
        return false;
    }
    return *index == IndexKeyKind::kString || is_numeric_key(key);
}

ObjectShape shape_of(const ObjectType& object)
{
    ObjectShape shape;
    for (const auto& property : object.properties) {
        shape.declared.insert(property.name);
    }
    if (object.index) {
        shape.index = object.index->key;
    }
    return shape;
}

std::vector<std::string> superfluous_keys(const nlohmann::json& value,
                                          const ObjectShape& shape,
                                          const ValidationContext& context,
                                          bool all)
{
    std::vector<std::string> keys;
    if (!value.is_object() || shape.index == IndexKeyKind::kString) {
        return keys;
    }
    for (const auto& entry : value.items()) {
        const std::string& key = entry.key();
        if (shape.covers(key) || context.is_allowed(&value, key)) {
            continue;
        }
        keys.push_back(key);
        if (!all) {
            break;
        }
    }
    return keys;
}

KeySet declared_keys(const std::vector<DescriptorPtr>& members,
                     const std::map<std::string, DescriptorPtr>& definitions)
{
    KeySet keys;
    std::set<std::string> visited;
    for (const auto& member : members) {
        collect_keys(member, definitions, visited, keys);
    }
    return keys;
}

std::vector<KeySet> allowed_keys(const std::vector<DescriptorPtr>& members,
                                 const std::map<std::string, DescriptorPtr>& definitions)
{
    std::vector<KeySet> own;
    own.reserve(members.size());
    for (const auto& member : members) {
        own.push_back(declared_keys({member}, definitions));
    }
    std::vector<KeySet> allowed(members.size());
    for (std::size_t i = 0; i < members.size(); ++i) {
        for (std::size_t j = 0; j < members.size(); ++j) {
            if (j != i) {
                allowed[i].insert(own[j].begin(), own[j].end());
            }
        }
    }
    return allowed;
}

}  // namespace typeguard::strictness
