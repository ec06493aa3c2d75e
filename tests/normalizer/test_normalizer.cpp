/**
 * @file test_normalizer.cpp
 * @brief Reference resolution, generic substitution and deduplication tests
 */

#include "typeguard/common.hpp"
#include "typeguard/descriptor.hpp"
#include "typeguard/normalizer.hpp"

#include <optional>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace typeguard::test {

namespace {

DescriptorPtr must(typeguard::Result<DescriptorPtr> result)
{
    EXPECT_TRUE(result) << (result ? "" : result.error().message);
    return result ? *result : nullptr;
}

DescriptorPtr object_of(std::vector<Property> properties,
                        std::optional<IndexSignature> index = std::nullopt)
{
    return must(types::object(std::move(properties), std::move(index)));
}

const ObjectType& as_object(const DescriptorPtr& node)
{
    const auto* object = node->as<ObjectType>();
    EXPECT_NE(object, nullptr);
    static const ObjectType kEmpty{};
    return object != nullptr ? *object : kEmpty;
}

}  // namespace

// ============================================================================
// TypeRegistry
// ============================================================================

TEST(TypeRegistryTest, RejectsInvalidDefinitions)
{
    TypeRegistry registry;
    ASSERT_TRUE(registry.define("A", types::string()));

    auto duplicate = registry.define("A", types::number());
    ASSERT_FALSE(duplicate);
    EXPECT_EQ(duplicate.error().code, errc::kMalformedDescriptor);

    EXPECT_FALSE(registry.define("", types::string()));
    EXPECT_FALSE(registry.define("Empty", nullptr));
    EXPECT_FALSE(registry.define_generic("Pair", {"T", "T"}, types::parameter("T")));
    EXPECT_EQ(registry.size(), 1U);
    EXPECT_NE(registry.find("A"), nullptr);
    EXPECT_EQ(registry.find("B"), nullptr);
}

// ============================================================================
// Resolution
// ============================================================================

TEST(NormalizerTest, SelfContainedDescriptor)
{
    auto normalized = normalize(types::array(types::string()));
    ASSERT_TRUE(normalized);
    EXPECT_EQ(to_string(*normalized->root), "string[]");
    EXPECT_TRUE(normalized->definitions.empty());
    EXPECT_TRUE(normalized->fingerprint.starts_with("sha256:"));
}

TEST(NormalizerTest, UnresolvedReference)
{
    auto normalized = normalize(types::reference("Missing"));
    ASSERT_FALSE(normalized);
    EXPECT_EQ(normalized.error().code, errc::kUnresolvedReference);
}

TEST(NormalizerTest, PropertyErrorsNameTheProperty)
{
    auto normalized =
        normalize(object_of({Property{.name = "owner", .type = types::reference("User")}}));
    ASSERT_FALSE(normalized);
    EXPECT_EQ(normalized.error().code, errc::kUnresolvedReference);
    EXPECT_NE(normalized.error().message.find("property \"owner\""), std::string::npos);
}

TEST(NormalizerTest, UnboundTypeParameter)
{
    auto normalized = normalize(types::array(types::parameter("T")));
    ASSERT_FALSE(normalized);
    EXPECT_EQ(normalized.error().code, errc::kUnboundTypeParameter);
}

TEST(NormalizerTest, NullChildIsMalformed)
{
    auto normalized = normalize(types::array(nullptr));
    ASSERT_FALSE(normalized);
    EXPECT_EQ(normalized.error().code, errc::kMalformedDescriptor);
}

TEST(NormalizerTest, NonRecursiveReferenceIsInlined)
{
    TypeRegistry registry;
    ASSERT_TRUE(registry.define("Point",
                                object_of({Property{.name = "x", .type = types::number()},
                                           Property{.name = "y", .type = types::number()}})));

    auto normalized = normalize(types::array(types::reference("Point")), registry);
    ASSERT_TRUE(normalized) << normalized.error().message;
    EXPECT_TRUE(normalized->definitions.empty());
    const auto* array = normalized->root->as<ArrayType>();
    ASSERT_NE(array, nullptr);
    EXPECT_EQ(array->element->kind(), DescriptorKind::kObject);
}

TEST(NormalizerTest, RecursiveDefinitionKeptByName)
{
    TypeRegistry registry;
    ASSERT_TRUE(registry.define(
        "Tree",
        object_of({Property{.name = "value", .type = types::number()},
                   Property{.name = "children", .type = types::array(types::reference("Tree"))}})));

    auto normalized = normalize(types::reference("Tree"), registry);
    ASSERT_TRUE(normalized) << normalized.error().message;
    ASSERT_EQ(normalized->definitions.size(), 1U);
    ASSERT_TRUE(normalized->definitions.contains("Tree"));

    const auto* root = normalized->root->as<ReferenceType>();
    ASSERT_NE(root, nullptr);
    EXPECT_EQ(root->target, "Tree");

    const auto& body = as_object(normalized->definitions.at("Tree"));
    ASSERT_EQ(body.properties.size(), 2U);
    const auto* children = body.properties[1].type->as<ArrayType>();
    ASSERT_NE(children, nullptr);
    ASSERT_NE(children->element->as<ReferenceType>(), nullptr);
    EXPECT_EQ(children->element->as<ReferenceType>()->target, "Tree");
}

TEST(NormalizerTest, MutualRecursionKeepsOneCycleEntry)
{
    TypeRegistry registry;
    ASSERT_TRUE(registry.define(
        "Parent",
        object_of({Property{.name = "child",
                            .type = types::union_of({types::reference("Child"), types::null()})}})));
    ASSERT_TRUE(registry.define(
        "Child", object_of({Property{.name = "parent", .type = types::reference("Parent")}})));

    auto normalized = normalize(types::reference("Parent"), registry);
    ASSERT_TRUE(normalized) << normalized.error().message;
    EXPECT_EQ(normalized->definitions.size(), 1U);
    EXPECT_TRUE(normalized->definitions.contains("Parent"));
}

TEST(NormalizerTest, CycleWithoutStructuralStep)
{
    TypeRegistry registry;
    ASSERT_TRUE(registry.define("Loop",
                                types::union_of({types::reference("Loop"), types::string()})));
    auto normalized = normalize(types::reference("Loop"), registry);
    ASSERT_FALSE(normalized);
    EXPECT_EQ(normalized.error().code, errc::kCyclicWithoutReference);
}

TEST(NormalizerTest, AliasCycle)
{
    TypeRegistry registry;
    ASSERT_TRUE(registry.define("A", types::reference("B")));
    ASSERT_TRUE(registry.define("B", types::intersection_of({types::reference("A")})));
    auto normalized = normalize(types::reference("A"), registry);
    ASSERT_FALSE(normalized);
    EXPECT_EQ(normalized.error().code, errc::kCyclicWithoutReference);
}

// ============================================================================
// Generics
// ============================================================================

TEST(NormalizerTest, GenericSubstitution)
{
    TypeRegistry registry;
    ASSERT_TRUE(registry.define_generic(
        "Box", {"T"}, object_of({Property{.name = "value", .type = types::parameter("T")}})));

    auto normalized = normalize(types::instantiate("Box", {types::number()}), registry);
    ASSERT_TRUE(normalized) << normalized.error().message;
    EXPECT_TRUE(normalized->definitions.empty());
    EXPECT_EQ(to_string(*normalized->root), "{ value: number }");
}

TEST(NormalizerTest, WrongArgumentCount)
{
    TypeRegistry registry;
    ASSERT_TRUE(registry.define_generic("Box", {"T"}, types::parameter("T")));
    auto normalized = normalize(types::instantiate("Box", {}), registry);
    ASSERT_FALSE(normalized);
    EXPECT_EQ(normalized.error().code, errc::kMalformedDescriptor);
}

TEST(NormalizerTest, RecursiveGenericInstantiationsAreDistinct)
{
    TypeRegistry registry;
    ASSERT_TRUE(registry.define_generic(
        "List",
        {"T"},
        object_of({Property{.name = "head", .type = types::parameter("T")},
                   Property{.name = "tail",
                            .type = types::union_of(
                                {types::instantiate("List", {types::parameter("T")}),
                                 types::null()})}})));

    auto root = object_of({
        Property{.name = "names", .type = types::instantiate("List", {types::string()})},
        Property{.name = "scores", .type = types::instantiate("List", {types::number()})},
    });
    auto normalized = normalize(root, registry);
    ASSERT_TRUE(normalized) << normalized.error().message;
    EXPECT_EQ(normalized->definitions.size(), 2U);
    EXPECT_TRUE(normalized->definitions.contains("List<string>"));
    EXPECT_TRUE(normalized->definitions.contains("List<number>"));
}

TEST(NormalizerTest, NonClosingExpansion)
{
    TypeRegistry registry;
    ASSERT_TRUE(registry.define_generic(
        "Nest",
        {"T"},
        object_of({Property{.name = "inner",
                            .type = types::instantiate("Nest",
                                                       {types::array(types::parameter("T"))})}})));

    auto normalized = normalize(types::instantiate("Nest", {types::string()}), registry);
    ASSERT_FALSE(normalized);
    EXPECT_EQ(normalized.error().code, errc::kInstantiationTooDeep);
}

TEST(NormalizerTest, SelfReferenceThroughGenericWrapper)
{
    // A = Box<A> where Box<T> = { value: T }
    TypeRegistry registry;
    ASSERT_TRUE(registry.define_generic(
        "Box", {"T"}, object_of({Property{.name = "value", .type = types::parameter("T")}})));
    ASSERT_TRUE(registry.define("A", types::instantiate("Box", {types::reference("A")})));

    auto normalized = normalize(types::reference("A"), registry);
    ASSERT_TRUE(normalized) << normalized.error().message;
    ASSERT_TRUE(normalized->definitions.contains("A"));
    const auto& body = as_object(normalized->definitions.at("A"));
    ASSERT_EQ(body.properties.size(), 1U);
    const auto* value = body.properties[0].type->as<ReferenceType>();
    ASSERT_NE(value, nullptr);
    EXPECT_EQ(value->target, "A");
}

TEST(NormalizerTest, RecursiveAliasThroughGenericIndexSignature)
{
    // Json = string | Dict<Json> where Dict<T> = { [key: string]: T }
    TypeRegistry registry;
    ASSERT_TRUE(registry.define_generic(
        "Dict",
        {"T"},
        object_of({},
                  IndexSignature{.key = IndexKeyKind::kString, .type = types::parameter("T")})));
    ASSERT_TRUE(registry.define(
        "Json",
        types::union_of(
            {types::string(), types::instantiate("Dict", {types::reference("Json")})})));

    auto normalized = normalize(types::reference("Json"), registry);
    ASSERT_TRUE(normalized) << normalized.error().message;
    EXPECT_TRUE(normalized->definitions.contains("Json"));
}

TEST(NormalizerTest, IdentityGenericCycleRejected)
{
    // A = Id<A> where Id<T> = T
    TypeRegistry registry;
    ASSERT_TRUE(registry.define_generic("Id", {"T"}, types::parameter("T")));
    ASSERT_TRUE(registry.define("A", types::instantiate("Id", {types::reference("A")})));

    auto normalized = normalize(types::reference("A"), registry);
    ASSERT_FALSE(normalized);
    EXPECT_EQ(normalized.error().code, errc::kCyclicWithoutReference);
}

TEST(NormalizerTest, NestedGenericArgumentsJudgedAtUseSite)
{
    TypeRegistry registry;
    ASSERT_TRUE(registry.define_generic("Id", {"T"}, types::parameter("T")));
    ASSERT_TRUE(registry.define_generic(
        "Wrap", {"T"}, object_of({Property{.name = "w", .type = types::parameter("T")}})));
    ASSERT_TRUE(registry.define_generic("Pass", {"T"}, types::parameter("T")));

    // A = Wrap<Id<A>>: the property step guards the cycle.
    ASSERT_TRUE(registry.define(
        "A", types::instantiate("Wrap", {types::instantiate("Id", {types::reference("A")})})));
    auto guarded = normalize(types::reference("A"), registry);
    ASSERT_TRUE(guarded) << guarded.error().message;
    EXPECT_TRUE(guarded->definitions.contains("A"));

    // B = Pass<Id<B>>: no structural step anywhere.
    ASSERT_TRUE(registry.define(
        "B", types::instantiate("Pass", {types::instantiate("Id", {types::reference("B")})})));
    auto unguarded = normalize(types::reference("B"), registry);
    ASSERT_FALSE(unguarded);
    EXPECT_EQ(unguarded.error().code, errc::kCyclicWithoutReference);
}

TEST(NormalizerTest, MemoizedAliasDoesNotHideCycle)
{
    // A = { x: B } | B where B = A. B is first resolved under a property and
    // reused at the top of A's union.
    TypeRegistry registry;
    ASSERT_TRUE(registry.define("B", types::reference("A")));
    ASSERT_TRUE(registry.define(
        "A",
        types::union_of({object_of({Property{.name = "x", .type = types::reference("B")}}),
                         types::reference("B")})));

    auto normalized = normalize(types::reference("A"), registry);
    ASSERT_FALSE(normalized);
    EXPECT_EQ(normalized.error().code, errc::kCyclicWithoutReference);
}

TEST(NormalizerTest, UnboundParameterInsideArgument)
{
    TypeRegistry registry;
    ASSERT_TRUE(registry.define_generic("Box", {"T"}, types::array(types::parameter("T"))));
    auto normalized =
        normalize(types::instantiate("Box", {types::array(types::parameter("U"))}), registry);
    ASSERT_FALSE(normalized);
    EXPECT_EQ(normalized.error().code, errc::kUnboundTypeParameter);
}

// ============================================================================
// Simplification and sharing
// ============================================================================

TEST(NormalizerTest, UnionFlattenedAndDeduplicated)
{
    auto input = types::union_of({
        types::string(),
        types::union_of({types::number(), types::string()}),
        types::never(),
    });
    auto normalized = normalize(input);
    ASSERT_TRUE(normalized);
    const auto* members = normalized->root->as<UnionType>();
    ASSERT_NE(members, nullptr);
    ASSERT_EQ(members->members.size(), 2U);
    EXPECT_TRUE(members->members[0]->is_primitive(PrimitiveKind::kString));
    EXPECT_TRUE(members->members[1]->is_primitive(PrimitiveKind::kNumber));
}

TEST(NormalizerTest, DegenerateUnionsAndIntersections)
{
    auto single = normalize(types::union_of({types::never(), types::boolean()}));
    ASSERT_TRUE(single);
    EXPECT_TRUE(single->root->is_primitive(PrimitiveKind::kBoolean));

    auto empty_union = normalize(types::union_of({}));
    ASSERT_TRUE(empty_union);
    EXPECT_TRUE(empty_union->root->is_primitive(PrimitiveKind::kNever));

    auto empty_intersection = normalize(types::intersection_of({types::unknown()}));
    ASSERT_TRUE(empty_intersection);
    EXPECT_TRUE(empty_intersection->root->is_primitive(PrimitiveKind::kUnknown));

    auto top_dropped = normalize(types::intersection_of({types::any(), types::number()}));
    ASSERT_TRUE(top_dropped);
    EXPECT_TRUE(top_dropped->root->is_primitive(PrimitiveKind::kNumber));
}

TEST(NormalizerTest, IdenticalSubtreesShareOneNode)
{
    auto make_point = [] {
        return object_of({Property{.name = "x", .type = types::number()}});
    };
    auto root = object_of({
        Property{.name = "from", .type = make_point()},
        Property{.name = "to", .type = make_point()},
    });
    auto normalized = normalize(root);
    ASSERT_TRUE(normalized);
    const auto& object = as_object(normalized->root);
    ASSERT_EQ(object.properties.size(), 2U);
    EXPECT_EQ(object.properties[0].type.get(), object.properties[1].type.get());
}

TEST(NormalizerTest, FingerprintIsStructural)
{
    TypeRegistry registry;
    ASSERT_TRUE(registry.define("Name", types::string()));

    auto via_reference = normalize(types::array(types::reference("Name")), registry);
    auto inline_type = normalize(types::array(types::string()));
    auto other = normalize(types::array(types::number()));
    ASSERT_TRUE(via_reference);
    ASSERT_TRUE(inline_type);
    ASSERT_TRUE(other);
    EXPECT_EQ(via_reference->fingerprint, inline_type->fingerprint);
    EXPECT_NE(inline_type->fingerprint, other->fingerprint);
}

TEST(NormalizerTest, RunIsRepeatable)
{
    TypeRegistry registry;
    ASSERT_TRUE(registry.define(
        "Node", object_of({Property{.name = "next", .type = types::union_of(
                                                           {types::reference("Node"),
                                                            types::null()})}})));
    Normalizer normalizer(registry);
    auto first = normalizer.run(types::reference("Node"));
    auto second = normalizer.run(types::reference("Node"));
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_EQ(first->fingerprint, second->fingerprint);
    EXPECT_EQ(second->definitions.size(), 1U);
    EXPECT_TRUE(second->definitions.contains("Node"));
}

}  // namespace typeguard::test
