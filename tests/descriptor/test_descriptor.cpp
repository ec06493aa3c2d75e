/**
 * @file test_descriptor.cpp
 * @brief Descriptor construction, fingerprints and rendering
 */

#include "typeguard/common.hpp"
#include "typeguard/descriptor.hpp"
#include "typeguard/value.hpp"

#include <limits>
#include <string>
#include <type_traits>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace typeguard::test {

namespace {

DescriptorPtr must(typeguard::Result<DescriptorPtr> result)
{
    EXPECT_TRUE(result) << (result ? "" : result.error().message);
    return result ? *result : nullptr;
}

DescriptorPtr point_type()
{
    return must(types::object({
        Property{.name = "x", .type = types::number()},
        Property{.name = "y", .type = types::number()},
    }));
}

}  // namespace

TEST(DescriptorTest, PrimitiveKinds)
{
    EXPECT_EQ(types::string()->kind(), DescriptorKind::kPrimitive);
    EXPECT_TRUE(types::string()->is_primitive(PrimitiveKind::kString));
    EXPECT_FALSE(types::string()->is_primitive(PrimitiveKind::kNumber));
    EXPECT_TRUE(types::never()->is_primitive(PrimitiveKind::kNever));
}

TEST(DescriptorTest, PrimitiveNamesRoundTrip)
{
    for (auto kind : {PrimitiveKind::kString,
                      PrimitiveKind::kNumber,
                      PrimitiveKind::kBoolean,
                      PrimitiveKind::kNull,
                      PrimitiveKind::kUndefined,
                      PrimitiveKind::kBigInt,
                      PrimitiveKind::kAny,
                      PrimitiveKind::kUnknown,
                      PrimitiveKind::kNever}) {
        auto parsed = primitive_kind_from_string(to_string(kind));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, kind);
    }
    EXPECT_FALSE(primitive_kind_from_string("symbol").has_value());
}

TEST(DescriptorTest, NodesAreOnlyBuiltThroughMake)
{
    static_assert(!std::is_constructible_v<Descriptor, DescriptorData, std::string>);
    static_assert(!std::is_default_constructible_v<Descriptor>);

    auto node = Descriptor::make(ArrayType{.element = types::string()});
    ASSERT_TRUE(node);
    EXPECT_EQ((*node)->kind(), DescriptorKind::kArray);
    EXPECT_EQ(node->use_count(), 1);
}

TEST(DescriptorTest, DuplicatePropertyRejected)
{
    auto result = types::object({
        Property{.name = "a", .type = types::string()},
        Property{.name = "a", .type = types::number()},
    });
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, errc::kMalformedDescriptor);
    EXPECT_NE(result.error().message.find("\"a\""), std::string::npos);
}

TEST(DescriptorTest, LiteralMustBeScalar)
{
    EXPECT_TRUE(types::literal("ok"));
    EXPECT_TRUE(types::literal(42));
    EXPECT_TRUE(types::literal(false));
    EXPECT_TRUE(types::literal(nullptr));
    EXPECT_TRUE(types::literal(make_bigint({0x01, 0x00})));

    auto object_literal = types::literal(nlohmann::json::object());
    ASSERT_FALSE(object_literal);
    EXPECT_EQ(object_literal.error().code, errc::kMalformedDescriptor);

    auto nan_literal = types::literal(std::numeric_limits<double>::quiet_NaN());
    ASSERT_FALSE(nan_literal);
    EXPECT_EQ(nan_literal.error().code, errc::kMalformedDescriptor);
}

TEST(DescriptorTest, TupleRestMustBeLast)
{
    auto ok = types::tuple({
        TupleElement{.type = types::string()},
        TupleElement{.type = types::number(), .rest = true},
    });
    ASSERT_TRUE(ok);
    const auto* tuple = (*ok)->as<TupleType>();
    ASSERT_NE(tuple, nullptr);
    EXPECT_EQ(tuple->elements.size(), 1U);
    ASSERT_NE(tuple->rest, nullptr);

    auto misplaced = types::tuple({
        TupleElement{.type = types::number(), .rest = true},
        TupleElement{.type = types::string()},
    });
    ASSERT_FALSE(misplaced);
    EXPECT_EQ(misplaced.error().code, errc::kMalformedDescriptor);
}

TEST(DescriptorTest, StructuralFingerprint)
{
    auto a = point_type();
    auto b = point_type();
    ASSERT_NE(a.get(), b.get());
    EXPECT_EQ(a->fingerprint(), b->fingerprint());
    EXPECT_TRUE(a->equivalent(*b));
    EXPECT_TRUE(a->fingerprint().starts_with("sha256:"));

    auto renamed = must(types::object({
        Property{.name = "x", .type = types::number()},
        Property{.name = "z", .type = types::number()},
    }));
    EXPECT_NE(a->fingerprint(), renamed->fingerprint());
    EXPECT_FALSE(a->equivalent(*renamed));
}

TEST(DescriptorTest, OptionalFlagChangesFingerprint)
{
    auto required = must(types::object({Property{.name = "a", .type = types::string()}}));
    auto optional = must(
        types::object({Property{.name = "a", .type = types::string(), .optional = true}}));
    EXPECT_NE(required->fingerprint(), optional->fingerprint());
}

TEST(DescriptorTest, IntegralFloatLiteralsShareFingerprint)
{
    auto as_integer = must(types::literal(1));
    auto as_float = must(types::literal(1.0));
    EXPECT_EQ(as_integer->fingerprint(), as_float->fingerprint());
}

TEST(DescriptorTest, UnionOrderMatters)
{
    auto ab = types::union_of({types::string(), types::number()});
    auto ba = types::union_of({types::number(), types::string()});
    EXPECT_NE(ab->fingerprint(), ba->fingerprint());
}

TEST(DescriptorTest, Children)
{
    auto object = must(types::object({Property{.name = "a", .type = types::string()}},
                                     IndexSignature{.key = IndexKeyKind::kString,
                                                    .type = types::number()}));
    const auto children = object->children();
    ASSERT_EQ(children.size(), 2U);
    EXPECT_TRUE(children[0]->is_primitive(PrimitiveKind::kString));
    EXPECT_TRUE(children[1]->is_primitive(PrimitiveKind::kNumber));
    EXPECT_TRUE(types::string()->children().empty());
}

TEST(DescriptorTest, CollectReferences)
{
    auto root = must(types::object({
        Property{.name = "head", .type = types::reference("Node")},
        Property{.name = "items", .type = types::instantiate("List", {types::reference("Item")})},
    }));
    const auto names = collect_references(root);
    EXPECT_EQ(names, (std::set<std::string>{"Item", "List", "Node"}));
}

TEST(DescriptorTest, Rendering)
{
    auto object = must(types::object({
        Property{.name = "name", .type = types::string(), .readonly = true},
        Property{.name = "tags",
                 .type = types::array(types::union_of({types::string(), types::number()})),
                 .optional = true},
    }));
    EXPECT_EQ(to_string(*object), "{ readonly name: string; tags?: (string | number)[] }");

    auto tuple = must(types::tuple({
        TupleElement{.type = types::string()},
        TupleElement{.type = types::boolean(), .rest = true},
    }));
    EXPECT_EQ(to_string(*tuple), "[string, ...boolean[]]");

    EXPECT_EQ(to_string(*must(types::literal("on"))), "\"on\"");
    EXPECT_EQ(to_string(*types::instantiate("Box", {types::number()})), "Box<number>");
    EXPECT_EQ(to_string(*must(types::object({}))), "{}");
}

}  // namespace typeguard::test
