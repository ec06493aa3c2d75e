/**
 * @file descriptor.cpp
 * @brief Descriptor construction, fingerprints and traversal helpers
 */

#include "typeguard/descriptor.hpp"

#include "typeguard/canonical_json.hpp"
#include "typeguard/common.hpp"
#include "typeguard/value.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <ranges>
#include <unordered_set>

namespace typeguard {

namespace {

template <typename... Ts>
struct Overloaded : Ts...
{
    using Ts::operator()...;
};

constexpr std::array<std::string_view, 9> kPrimitiveNames = {
    "string", "number", "boolean", "null", "undefined", "bigint", "any", "unknown", "never"};

[[nodiscard]] nlohmann::json child_fingerprint(const DescriptorPtr& child)
{
    if (!child) {
        return nullptr;
    }
    return child->fingerprint();
}

[[nodiscard]] nlohmann::json child_fingerprints(const std::vector<DescriptorPtr>& children)
{
    nlohmann::json result = nlohmann::json::array();
    for (const auto& child : children) {
        result.push_back(child_fingerprint(child));
    }
    return result;
}

/// One level of structure; children are represented by their fingerprints.
[[nodiscard]] nlohmann::json shape_of(const DescriptorData& data)
{
    return std::visit(
        Overloaded{
            [](const PrimitiveType& node) -> nlohmann::json {
                return {
                    {"kind", to_string(node.kind)}
                };
            },
            [](const LiteralType& node) -> nlohmann::json {
                return {
                    { "kind",                                 "literal"},
                    {"value", canonical::canonical_numbers(node.value)}
                };
            },
            [](const ArrayType& node) -> nlohmann::json {
                return {
                    {   "kind",                         "array"},
                    {"element", child_fingerprint(node.element)}
                };
            },
            [](const TupleType& node) -> nlohmann::json {
                return {
                    {    "kind",                           "tuple"},
                    {"elements", child_fingerprints(node.elements)},
                    {    "rest",      child_fingerprint(node.rest)}
                };
            },
            [](const ObjectType& node) -> nlohmann::json {
                nlohmann::json properties = nlohmann::json::array();
                for (const auto& property : node.properties) {
                    properties.push_back({
                        {    "name",                   property.name},
                        {    "type", child_fingerprint(property.type)},
                        {"optional",               property.optional},
                        {"readonly",               property.readonly}
                    });
                }
                nlohmann::json index = nullptr;
                if (node.index) {
                    index = {
                        { "key", node.index->key == IndexKeyKind::kString ? "string" : "number"},
                        {"type",                           child_fingerprint(node.index->type)}
                    };
                }
                return {
                    {      "kind",   "object"},
                    {"properties", properties},
                    {     "index",      index}
                };
            },
            [](const UnionType& node) -> nlohmann::json {
                return {
                    {   "kind",                         "union"},
                    {"members", child_fingerprints(node.members)}
                };
            },
            [](const IntersectionType& node) -> nlohmann::json {
                return {
                    {   "kind",                  "intersection"},
                    {"members", child_fingerprints(node.members)}
                };
            },
            [](const ReferenceType& node) -> nlohmann::json {
                return {
                    {"kind", "reference"},
                    {"name", node.target}
                };
            },
            [](const GenericInstantiationType& node) -> nlohmann::json {
                return {
                    {     "kind",                      "instantiate"},
                    {     "base",                          node.base},
                    {"arguments", child_fingerprints(node.arguments)}
                };
            },
            [](const TypeParameterType& node) -> nlohmann::json {
                return {
                    {"kind", "parameter"},
                    {"name",   node.name}
                };
            },
        },
        data);
}

// nlohmann::json objects keep their keys sorted, so the dump is canonical.
[[nodiscard]] std::string fingerprint_of(const DescriptorData& data)
{
    return common::sha256_prefixed(
        shape_of(data).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

[[nodiscard]] bool is_scalar_literal(const nlohmann::json& value)
{
    return value.is_string() || value.is_number() || value.is_boolean() || value.is_null()
           || is_bigint(value);
}

[[nodiscard]] Error malformed(std::string message)
{
    return Error::make(errc::kMalformedDescriptor, std::move(message));
}

/// Null children are left to the normalizer, which reports them with context.
[[nodiscard]] typeguard::VoidResult validate_shape(const DescriptorData& data)
{
    if (const auto* literal = std::get_if<LiteralType>(&data)) {
        if (!is_scalar_literal(literal->value)) {
            return std::unexpected(malformed(std::format(
                "literal must be a scalar value, got {}", to_string(value_kind(literal->value)))));
        }
        if (auto finite = canonical::validate_for_canonical(literal->value); !finite) {
            return std::unexpected(malformed(finite.error().message));
        }
        return {};
    }
    if (const auto* object = std::get_if<ObjectType>(&data)) {
        std::unordered_set<std::string_view> seen;
        for (const auto& property : object->properties) {
            if (!seen.insert(property.name).second) {
                return std::unexpected(
                    malformed(std::format("duplicate property name \"{}\"", property.name)));
            }
        }
    }
    return {};
}

[[nodiscard]] bool equivalent_ptr(const DescriptorPtr& lhs, const DescriptorPtr& rhs)
{
    if (!lhs || !rhs) {
        return lhs == rhs;
    }
    return lhs->equivalent(*rhs);
}

[[nodiscard]] bool equivalent_all(const std::vector<DescriptorPtr>& lhs,
                                  const std::vector<DescriptorPtr>& rhs)
{
    return std::ranges::equal(lhs, rhs, equivalent_ptr);
}

[[nodiscard]] bool needs_parentheses(const Descriptor& descriptor)
{
    return descriptor.kind() == DescriptorKind::kUnion
           || descriptor.kind() == DescriptorKind::kIntersection;
}

[[nodiscard]] std::string render_ptr(const DescriptorPtr& descriptor)
{
    return descriptor ? to_string(*descriptor) : std::string("<null>");
}

[[nodiscard]] std::string render_operand(const DescriptorPtr& descriptor)
{
    if (descriptor && needs_parentheses(*descriptor)) {
        return "(" + to_string(*descriptor) + ")";
    }
    return render_ptr(descriptor);
}

[[nodiscard]] std::string render_list(const std::vector<DescriptorPtr>& items,
                                      std::string_view separator,
                                      bool parenthesize)
{
    std::string result;
    for (auto [i, item] : std::views::enumerate(items)) {
        if (i > 0) {
            result += separator;
        }
        result += parenthesize ? render_operand(item) : render_ptr(item);
    }
    return result;
}

}  // namespace

Descriptor::Descriptor(ConstructionKey /*key*/, DescriptorData data, std::string fingerprint)
    : m_data(std::move(data))
    , m_fingerprint(std::move(fingerprint))
{}

typeguard::Result<DescriptorPtr> Descriptor::make(DescriptorData data)
{
    if (auto valid = validate_shape(data); !valid) {
        return std::unexpected(valid.error());
    }
    std::string fingerprint = fingerprint_of(data);
    return std::make_shared<const Descriptor>(
        ConstructionKey{}, std::move(data), std::move(fingerprint));
}

std::vector<DescriptorPtr> Descriptor::children() const
{
    return std::visit(
        Overloaded{
            [](const PrimitiveType&) { return std::vector<DescriptorPtr>{}; },
            [](const LiteralType&) { return std::vector<DescriptorPtr>{}; },
            [](const ArrayType& node) { return std::vector<DescriptorPtr>{node.element}; },
            [](const TupleType& node) {
                auto result = node.elements;
                if (node.rest) {
                    result.push_back(node.rest);
                }
                return result;
            },
            [](const ObjectType& node) {
                std::vector<DescriptorPtr> result;
                result.reserve(node.properties.size() + 1);
                for (const auto& property : node.properties) {
                    result.push_back(property.type);
                }
                if (node.index) {
                    result.push_back(node.index->type);
                }
                return result;
            },
            [](const UnionType& node) { return node.members; },
            [](const IntersectionType& node) { return node.members; },
            [](const ReferenceType&) { return std::vector<DescriptorPtr>{}; },
            [](const GenericInstantiationType& node) { return node.arguments; },
            [](const TypeParameterType&) { return std::vector<DescriptorPtr>{}; },
        },
        m_data);
}

bool Descriptor::is_primitive(PrimitiveKind kind) const noexcept
{
    const auto* primitive = as<PrimitiveType>();
    return primitive != nullptr && primitive->kind == kind;
}

bool Descriptor::equivalent(const Descriptor& other) const
{
    if (this == &other) {
        return true;
    }
    if (m_fingerprint != other.m_fingerprint || kind() != other.kind()) {
        return false;
    }
    return std::visit(
        Overloaded{
            [](const PrimitiveType& lhs, const PrimitiveType& rhs) { return lhs.kind == rhs.kind; },
            [](const LiteralType& lhs, const LiteralType& rhs) { return lhs.value == rhs.value; },
            [](const ArrayType& lhs, const ArrayType& rhs) {
                return equivalent_ptr(lhs.element, rhs.element);
            },
            [](const TupleType& lhs, const TupleType& rhs) {
                return equivalent_all(lhs.elements, rhs.elements)
                       && equivalent_ptr(lhs.rest, rhs.rest);
            },
            [](const ObjectType& lhs, const ObjectType& rhs) {
                const bool same_properties = std::ranges::equal(
                    lhs.properties, rhs.properties, [](const Property& a, const Property& b) {
                        return a.name == b.name && a.optional == b.optional
                               && a.readonly == b.readonly && equivalent_ptr(a.type, b.type);
                    });
                if (!same_properties || lhs.index.has_value() != rhs.index.has_value()) {
                    return false;
                }
                return !lhs.index
                       || (lhs.index->key == rhs.index->key
                           && equivalent_ptr(lhs.index->type, rhs.index->type));
            },
            [](const UnionType& lhs, const UnionType& rhs) {
                return equivalent_all(lhs.members, rhs.members);
            },
            [](const IntersectionType& lhs, const IntersectionType& rhs) {
                return equivalent_all(lhs.members, rhs.members);
            },
            [](const ReferenceType& lhs, const ReferenceType& rhs) {
                return lhs.target == rhs.target;
            },
            [](const GenericInstantiationType& lhs, const GenericInstantiationType& rhs) {
                return lhs.base == rhs.base && equivalent_all(lhs.arguments, rhs.arguments);
            },
            [](const TypeParameterType& lhs, const TypeParameterType& rhs) {
                return lhs.name == rhs.name;
            },
            [](const auto&, const auto&) { return false; },
        },
        m_data,
        other.m_data);
}

namespace types {

namespace {

// Shapes built here carry no invariant that Descriptor::make checks.
[[nodiscard]] DescriptorPtr make_unchecked(DescriptorData data)
{
    auto made = Descriptor::make(std::move(data));
    return made ? *made : nullptr;
}

}  // namespace

DescriptorPtr primitive(PrimitiveKind kind)
{
    return make_unchecked(PrimitiveType{.kind = kind});
}

DescriptorPtr string()
{
    return primitive(PrimitiveKind::kString);
}

DescriptorPtr number()
{
    return primitive(PrimitiveKind::kNumber);
}

DescriptorPtr boolean()
{
    return primitive(PrimitiveKind::kBoolean);
}

DescriptorPtr null()
{
    return primitive(PrimitiveKind::kNull);
}

DescriptorPtr undefined()
{
    return primitive(PrimitiveKind::kUndefined);
}

DescriptorPtr bigint()
{
    return primitive(PrimitiveKind::kBigInt);
}

DescriptorPtr any()
{
    return primitive(PrimitiveKind::kAny);
}

DescriptorPtr unknown()
{
    return primitive(PrimitiveKind::kUnknown);
}

DescriptorPtr never()
{
    return primitive(PrimitiveKind::kNever);
}

typeguard::Result<DescriptorPtr> literal(nlohmann::json value)
{
    return Descriptor::make(LiteralType{.value = std::move(value)});
}

DescriptorPtr array(DescriptorPtr element)
{
    return make_unchecked(ArrayType{.element = std::move(element)});
}

typeguard::Result<DescriptorPtr> tuple(std::vector<TupleElement> elements)
{
    TupleType node;
    for (auto [i, element] : std::views::enumerate(elements)) {
        if (!element.rest) {
            node.elements.push_back(std::move(element.type));
            continue;
        }
        if (static_cast<std::size_t>(i) + 1 != elements.size()) {
            return std::unexpected(Error::make(
                errc::kMalformedDescriptor,
                std::format("tuple rest element at position {} is not in final position", i)));
        }
        if (!element.type) {
            return std::unexpected(
                Error::make(errc::kMalformedDescriptor, "tuple rest element type is null"));
        }
        node.rest = std::move(element.type);
    }
    return Descriptor::make(std::move(node));
}

typeguard::Result<DescriptorPtr> object(std::vector<Property> properties,
                                        std::optional<IndexSignature> index)
{
    return Descriptor::make(
        ObjectType{.properties = std::move(properties), .index = std::move(index)});
}

DescriptorPtr union_of(std::vector<DescriptorPtr> members)
{
    return make_unchecked(UnionType{.members = std::move(members)});
}

DescriptorPtr intersection_of(std::vector<DescriptorPtr> members)
{
    return make_unchecked(IntersectionType{.members = std::move(members)});
}

DescriptorPtr reference(std::string target)
{
    return make_unchecked(ReferenceType{.target = std::move(target)});
}

DescriptorPtr instantiate(std::string base, std::vector<DescriptorPtr> arguments)
{
    return make_unchecked(
        GenericInstantiationType{.base = std::move(base), .arguments = std::move(arguments)});
}

DescriptorPtr parameter(std::string name)
{
    return make_unchecked(TypeParameterType{.name = std::move(name)});
}

}  // namespace types

std::set<std::string> collect_references(const DescriptorPtr& root)
{
    std::set<std::string> names;
    std::vector<const Descriptor*> pending;
    if (root) {
        pending.push_back(root.get());
    }
    while (!pending.empty()) {
        const Descriptor* node = pending.back();
        pending.pop_back();
        if (const auto* reference = node->as<ReferenceType>()) {
            names.insert(reference->target);
        } else if (const auto* instance = node->as<GenericInstantiationType>()) {
            names.insert(instance->base);
        }
        for (const auto& child : node->children()) {
            if (child) {
                pending.push_back(child.get());
            }
        }
    }
    return names;
}

std::string_view to_string(PrimitiveKind kind) noexcept
{
    return kPrimitiveNames[static_cast<std::size_t>(kind)];
}

std::optional<PrimitiveKind> primitive_kind_from_string(std::string_view name)
{
    const auto it = std::ranges::find(kPrimitiveNames, name);
    if (it == kPrimitiveNames.end()) {
        return std::nullopt;
    }
    return static_cast<PrimitiveKind>(std::distance(kPrimitiveNames.begin(), it));
}

std::string to_string(const Descriptor& descriptor)
{
    return std::visit(
        Overloaded{
            [](const PrimitiveType& node) { return std::string(to_string(node.kind)); },
            [](const LiteralType& node) {
                if (is_bigint(node.value)) {
                    return std::string("bigint literal");
                }
                return node.value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
            },
            [](const ArrayType& node) { return render_operand(node.element) + "[]"; },
            [](const TupleType& node) {
                std::string result = "[" + render_list(node.elements, ", ", false);
                if (node.rest) {
                    result += node.elements.empty() ? "..." : ", ...";
                    result += render_operand(node.rest) + "[]";
                }
                return result + "]";
            },
            [](const ObjectType& node) {
                if (node.properties.empty() && !node.index) {
                    return std::string("{}");
                }
                std::string result = "{ ";
                for (const auto& property : node.properties) {
                    result += std::format("{}{}{}: {}; ",
                                          property.readonly ? "readonly " : "",
                                          property.name,
                                          property.optional ? "?" : "",
                                          render_ptr(property.type));
                }
                if (node.index) {
                    result += std::format("[key: {}]: {}; ",
                                          node.index->key == IndexKeyKind::kString ? "string"
                                                                                   : "number",
                                          render_ptr(node.index->type));
                }
                result.resize(result.size() - 2);
                return result + " }";
            },
            [](const UnionType& node) {
                if (node.members.empty()) {
                    return std::string("never");
                }
                return render_list(node.members, " | ", false);
            },
            [](const IntersectionType& node) {
                if (node.members.empty()) {
                    return std::string("unknown");
                }
                return render_list(node.members, " & ", true);
            },
            [](const ReferenceType& node) { return node.target; },
            [](const GenericInstantiationType& node) {
                return node.base + "<" + render_list(node.arguments, ", ", false) + ">";
            },
            [](const TypeParameterType& node) { return node.name; },
        },
        descriptor.data());
}

}  // namespace typeguard
