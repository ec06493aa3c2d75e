/**
 * @file test_descriptor_json.cpp
 * @brief Descriptor document parsing and serialization
 */

#include "typeguard/common.hpp"
#include "typeguard/config.hpp"
#include "typeguard/descriptor.hpp"
#include "typeguard/descriptor_json.hpp"
#include "typeguard/normalizer.hpp"

#include <filesystem>
#include <fstream>
#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace typeguard::test {

namespace {

using Json = nlohmann::json;

Json list_document()
{
    return Json::parse(R"({
        "schema_version": "typeguard.descriptor.v1",
        "definitions": {
            "List": {
                "parameters": ["T"],
                "type": {
                    "kind": "object",
                    "properties": [
                        { "name": "value", "type": { "kind": "parameter", "name": "T" } },
                        { "name": "next", "type": { "kind": "union", "members": [
                            { "kind": "instantiate", "base": "List",
                              "arguments": [{ "kind": "parameter", "name": "T" }] },
                            { "kind": "null" }
                        ] } }
                    ]
                }
            }
        },
        "root": { "kind": "instantiate", "base": "List", "arguments": [{ "kind": "string" }] }
    })");
}

class TempFile
{
public:
    TempFile(const std::string& name, const Json& content)
        : m_path(std::filesystem::temp_directory_path() / name)
    {
        std::ofstream out(m_path);
        out << content.dump(2);
    }
    ~TempFile()
    {
        std::error_code ec;
        std::filesystem::remove(m_path, ec);
    }
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    [[nodiscard]] std::string path() const { return m_path.string(); }

private:
    std::filesystem::path m_path;
};

}  // namespace

TEST(DescriptorJsonTest, ParsesPrimitive)
{
    auto parsed = descriptor_from_json(Json{
        {"kind", "boolean"}
    });
    ASSERT_TRUE(parsed);
    EXPECT_TRUE((*parsed)->is_primitive(PrimitiveKind::kBoolean));
}

TEST(DescriptorJsonTest, ParsesObjectWithIndex)
{
    auto parsed = descriptor_from_json(Json::parse(R"({
        "kind": "object",
        "properties": [
            { "name": "id", "type": { "kind": "number" }, "readonly": true },
            { "name": "label", "type": { "kind": "string" }, "optional": true }
        ],
        "index": { "key": "number", "type": { "kind": "boolean" } }
    })"));
    ASSERT_TRUE(parsed) << parsed.error().message;
    const auto* object = (*parsed)->as<ObjectType>();
    ASSERT_NE(object, nullptr);
    ASSERT_EQ(object->properties.size(), 2U);
    EXPECT_TRUE(object->properties[0].readonly);
    EXPECT_FALSE(object->properties[0].optional);
    EXPECT_TRUE(object->properties[1].optional);
    ASSERT_TRUE(object->index.has_value());
    EXPECT_EQ(object->index->key, IndexKeyKind::kNumber);
}

TEST(DescriptorJsonTest, ErrorLocation)
{
    auto parsed = descriptor_from_json(Json::parse(R"({
        "kind": "array",
        "element": { "kind": "tuple", "elements": [{ "type": { "kind": "mystery" } }] }
    })"));
    ASSERT_FALSE(parsed);
    EXPECT_EQ(parsed.error().code, errc::kMalformedDescriptor);
    EXPECT_NE(parsed.error().message.find("#/element/elements/0/type"), std::string::npos)
        << parsed.error().message;
}

TEST(DescriptorJsonTest, DuplicatePropertyReportsLocation)
{
    auto parsed = descriptor_from_json(Json::parse(R"({
        "kind": "object",
        "properties": [
            { "name": "a", "type": { "kind": "string" } },
            { "name": "a", "type": { "kind": "number" } }
        ]
    })"));
    ASSERT_FALSE(parsed);
    EXPECT_EQ(parsed.error().code, errc::kMalformedDescriptor);
    EXPECT_TRUE(parsed.error().message.starts_with("#:"));
}

TEST(DescriptorJsonTest, OpaqueTypesRejectedByDefault)
{
    const Json node = {
        {"kind", "function"}
    };
    auto rejected = descriptor_from_json(node);
    ASSERT_FALSE(rejected);
    EXPECT_EQ(rejected.error().code, errc::kUnsupportedType);

    auto allowed = descriptor_from_json(node, config::OpaqueTypePolicy::kAllow);
    ASSERT_TRUE(allowed);
    EXPECT_TRUE((*allowed)->is_primitive(PrimitiveKind::kAny));
}

TEST(DescriptorJsonTest, RoundTripPreservesStructure)
{
    const Json node = Json::parse(R"({
        "kind": "tuple",
        "elements": [
            { "type": { "kind": "literal", "value": "tag" } },
            { "type": { "kind": "intersection", "members": [
                { "kind": "reference", "name": "A" },
                { "kind": "object", "properties": [] }
            ] } },
            { "type": { "kind": "number" }, "rest": true }
        ]
    })");
    auto parsed = descriptor_from_json(node);
    ASSERT_TRUE(parsed) << parsed.error().message;
    auto reparsed = descriptor_from_json(descriptor_to_json(**parsed));
    ASSERT_TRUE(reparsed) << reparsed.error().message;
    EXPECT_TRUE((*parsed)->equivalent(**reparsed));
}

TEST(DescriptorJsonTest, LoadsDocument)
{
    auto document = load_type_document(list_document());
    ASSERT_TRUE(document) << document.error().message;
    EXPECT_EQ(document->registry.size(), 1U);
    const auto* list = document->registry.find("List");
    ASSERT_NE(list, nullptr);
    EXPECT_EQ(list->parameters, std::vector<std::string>{"T"});
    EXPECT_EQ(document->root->kind(), DescriptorKind::kGenericInstantiation);

    auto normalized = normalize(document->root, document->registry);
    ASSERT_TRUE(normalized) << normalized.error().message;
    EXPECT_TRUE(normalized->definitions.contains("List<string>"));
}

TEST(DescriptorJsonTest, RejectsWrongSchemaVersion)
{
    Json document = list_document();
    document["schema_version"] = "typeguard.descriptor.v0";
    auto loaded = load_type_document(document);
    ASSERT_FALSE(loaded);
    EXPECT_EQ(loaded.error().code, errc::kMalformedDescriptor);
}

TEST(DescriptorJsonTest, DefinitionErrorsNameTheDefinition)
{
    Json document = list_document();
    document["definitions"]["Broken"] = {
        {"type", {{"kind", "array"}}}
    };
    auto loaded = load_type_document(document);
    ASSERT_FALSE(loaded);
    EXPECT_NE(loaded.error().message.find("#/definitions/Broken/type"), std::string::npos)
        << loaded.error().message;
}

TEST(DescriptorJsonTest, NormalizedToJson)
{
    auto document = load_type_document(list_document());
    ASSERT_TRUE(document);
    auto normalized = normalize(document->root, document->registry);
    ASSERT_TRUE(normalized);

    const Json out = normalized_to_json(*normalized);
    EXPECT_EQ(out.at("fingerprint"), normalized->fingerprint);
    EXPECT_EQ(out.at("root").at("kind"), "reference");
    EXPECT_EQ(out.at("root").at("name"), "List<string>");
    EXPECT_EQ(out.at("definitions").at("List<string>").at("kind"), "object");
}

TEST(DescriptorJsonTest, LoadsFileAgainstSchema)
{
    TempFile file("typeguard_test_descriptor_valid.json", list_document());
    auto loaded = load_type_document_file(file.path(), TYPEGUARD_SCHEMA_DIR);
    ASSERT_TRUE(loaded) << loaded.error().message;
    EXPECT_EQ(loaded->registry.size(), 1U);
}

TEST(DescriptorJsonTest, FileFailingSchemaIsReported)
{
    Json document = list_document();
    document["unexpected"] = true;
    TempFile file("typeguard_test_descriptor_invalid.json", document);
    auto loaded = load_type_document_file(file.path(), TYPEGUARD_SCHEMA_DIR);
    ASSERT_FALSE(loaded);
    EXPECT_EQ(loaded.error().code, errc::kSchemaInvalid);
}

TEST(DescriptorJsonTest, MissingFile)
{
    auto loaded = load_type_document_file("/nonexistent/typeguard/type.json", TYPEGUARD_SCHEMA_DIR);
    ASSERT_FALSE(loaded);
    EXPECT_EQ(loaded.error().code, errc::kIoError);
}

}  // namespace typeguard::test
