#pragma once

/**
 * @file descriptor.hpp
 * @brief Immutable structural type descriptors
 *
 * A descriptor is a closed sum over type shapes. Nodes are shared and never
 * mutated after construction; recursion is expressed only through named
 * ReferenceType nodes resolved by the normalizer, never through a pointer
 * back to an enclosing node.
 */

#include "typeguard/common.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace typeguard {

enum class PrimitiveKind {
    kString,
    kNumber,
    kBoolean,
    kNull,
    kUndefined,  ///< Absence of a value
    kBigInt,
    kAny,
    kUnknown,
    kNever
};

/// Kind of a descriptor node; the order matches the DescriptorData alternatives.
enum class DescriptorKind {
    kPrimitive,
    kLiteral,
    kArray,
    kTuple,
    kObject,
    kUnion,
    kIntersection,
    kReference,
    kGenericInstantiation,
    kTypeParameter
};

class Descriptor;
using DescriptorPtr = std::shared_ptr<const Descriptor>;

struct PrimitiveType
{
    PrimitiveKind kind;
};

struct LiteralType
{
    nlohmann::json value;  ///< Scalar compared with === semantics
};

struct ArrayType
{
    DescriptorPtr element;
};

struct TupleType
{
    std::vector<DescriptorPtr> elements;
    DescriptorPtr rest;  ///< Variadic tail element type, may be null
};

struct Property
{
    std::string name;
    DescriptorPtr type;
    bool optional = false;
    bool readonly = false;  ///< Static-only; never checked at run time
};

enum class IndexKeyKind { kString, kNumber };

struct IndexSignature
{
    IndexKeyKind key = IndexKeyKind::kString;
    DescriptorPtr type;
};

struct ObjectType
{
    std::vector<Property> properties;  ///< Declaration order
    std::optional<IndexSignature> index;
};

struct UnionType
{
    std::vector<DescriptorPtr> members;  ///< Order decides diagnostic precedence
};

struct IntersectionType
{
    std::vector<DescriptorPtr> members;
};

struct ReferenceType
{
    std::string target;
};

struct GenericInstantiationType
{
    std::string base;
    std::vector<DescriptorPtr> arguments;
};

struct TypeParameterType
{
    std::string name;
};

using DescriptorData = std::variant<PrimitiveType,
                                    LiteralType,
                                    ArrayType,
                                    TupleType,
                                    ObjectType,
                                    UnionType,
                                    IntersectionType,
                                    ReferenceType,
                                    GenericInstantiationType,
                                    TypeParameterType>;

class Descriptor
{
    /// Restricts construction to make() while still allowing std::make_shared.
    struct ConstructionKey
    {
        explicit ConstructionKey() = default;
    };

public:
    Descriptor(ConstructionKey key, DescriptorData data, std::string fingerprint);

    /**
     * @brief Validate shape invariants and build a node
     *
     * Fails with MalformedDescriptor on duplicate property names and on
     * literals that are not finite scalars. Null children are reported by
     * the normalizer.
     */
    [[nodiscard]] static typeguard::Result<DescriptorPtr> make(DescriptorData data);

    [[nodiscard]] DescriptorKind kind() const noexcept
    {
        return static_cast<DescriptorKind>(m_data.index());
    }

    [[nodiscard]] const DescriptorData& data() const noexcept { return m_data; }

    template <typename T>
    [[nodiscard]] const T* as() const noexcept
    {
        return std::get_if<T>(&m_data);
    }

    /// Stable structural hash ("sha256:..."); equal for structurally equal nodes.
    [[nodiscard]] const std::string& fingerprint() const noexcept { return m_fingerprint; }

    /// Direct child descriptors in declaration order.
    [[nodiscard]] std::vector<DescriptorPtr> children() const;

    /// Deep structural equality.
    [[nodiscard]] bool equivalent(const Descriptor& other) const;

    [[nodiscard]] bool is_primitive(PrimitiveKind kind) const noexcept;

private:
    DescriptorData m_data;
    std::string m_fingerprint;
};

struct TupleElement
{
    DescriptorPtr type;
    bool rest = false;
};

/**
 * Descriptor factories.
 *
 * Factories whose inputs can violate an invariant return a Result; the
 * others cannot fail. Null children are rejected by the normalizer.
 */
namespace types {

[[nodiscard]] DescriptorPtr primitive(PrimitiveKind kind);
[[nodiscard]] DescriptorPtr string();
[[nodiscard]] DescriptorPtr number();
[[nodiscard]] DescriptorPtr boolean();
[[nodiscard]] DescriptorPtr null();
[[nodiscard]] DescriptorPtr undefined();
[[nodiscard]] DescriptorPtr bigint();
[[nodiscard]] DescriptorPtr any();
[[nodiscard]] DescriptorPtr unknown();
[[nodiscard]] DescriptorPtr never();

[[nodiscard]] typeguard::Result<DescriptorPtr> literal(nlohmann::json value);
[[nodiscard]] DescriptorPtr array(DescriptorPtr element);

/// A rest element is only allowed in final position.
[[nodiscard]] typeguard::Result<DescriptorPtr> tuple(std::vector<TupleElement> elements);

[[nodiscard]] typeguard::Result<DescriptorPtr>
object(std::vector<Property> properties, std::optional<IndexSignature> index = std::nullopt);

[[nodiscard]] DescriptorPtr union_of(std::vector<DescriptorPtr> members);
[[nodiscard]] DescriptorPtr intersection_of(std::vector<DescriptorPtr> members);
[[nodiscard]] DescriptorPtr reference(std::string target);
[[nodiscard]] DescriptorPtr instantiate(std::string base, std::vector<DescriptorPtr> arguments);
[[nodiscard]] DescriptorPtr parameter(std::string name);

}  // namespace types

// ============================================================================
// Traversal helpers
// ============================================================================

/// Names referenced by ReferenceType and GenericInstantiationType nodes in a subtree.
[[nodiscard]] std::set<std::string> collect_references(const DescriptorPtr& root);

/// TypeScript-like rendering ("{ a: string; b?: number[] }").
[[nodiscard]] std::string to_string(const Descriptor& descriptor);

[[nodiscard]] std::string_view to_string(PrimitiveKind kind) noexcept;

[[nodiscard]] std::optional<PrimitiveKind> primitive_kind_from_string(std::string_view name);

}  // namespace typeguard
