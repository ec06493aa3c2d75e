/**
 * @file schema_validate.cpp
 * @brief JSON Schema validation using valijson
 */

#include "typeguard/schema_validate.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <memory>
#include <vector>

#include <valijson/adapters/nlohmann_json_adapter.hpp>
#include <valijson/schema.hpp>
#include <valijson/schema_parser.hpp>
#include <valijson/validator.hpp>

namespace typeguard::common {

namespace {

// valijson resolves "#/definitions/..." only; the shipped schemas use "$defs".
void rewrite_defs_ref(nlohmann::json& value)
{
    if (!value.is_string()) {
        return;
    }
    std::string ref = value.get<std::string>();
    constexpr std::string_view kPrefix = "#/$defs/";
    if (ref.starts_with(kPrefix)) {
        value = "#/definitions/" + ref.substr(kPrefix.size());
    }
}

void rewrite_schema_defs(nlohmann::json& schema)
{
    if (schema.is_object()) {
        if (schema.contains("$defs") && !schema.contains("definitions")) {
            schema["definitions"] = schema["$defs"];
        }
        for (auto& [key, value] : schema.items()) {
            if (key == "$ref") {
                rewrite_defs_ref(value);
            } else {
                rewrite_schema_defs(value);
            }
        }
        return;
    }
    if (schema.is_array()) {
        for (auto& value : schema) {
            rewrite_schema_defs(value);
        }
    }
}

[[nodiscard]] typeguard::Result<nlohmann::json> read_schema(const std::filesystem::path& path)
{
    std::ifstream stream(path);
    if (!stream) {
        return std::unexpected(
            Error::make(errc::kIoError, "Failed to open schema file: " + path.string()));
    }
    nlohmann::json schema;
    try {
        stream >> schema;
    } catch (const std::exception& ex) {
        return std::unexpected(Error::make(
            errc::kParseError, std::string("Failed to parse schema JSON: ") + ex.what()));
    }
    rewrite_schema_defs(schema);
    return schema;
}

std::string format_validation_errors(valijson::ValidationResults& results)
{
    std::string result;
    valijson::ValidationResults::Error error;

    while (results.popError(error)) {
        std::string context;
        for (const auto& part : error.context) {
            context += "/" + part;
        }
        if (context.empty()) {
            context = "/";
        }

        if (!result.empty()) {
            result += '\n';
        }
        result += std::format("{}: {}", context, error.description);
    }

    return result;
}

}  // namespace

typeguard::VoidResult validate_json(const nlohmann::json& j, const std::string& schema_path)
{
    auto schema_json = read_schema(schema_path);
    if (!schema_json) {
        return std::unexpected(schema_json.error());
    }

    valijson::Schema schema;
    valijson::SchemaParser parser;
    const auto schema_dir = std::filesystem::path(schema_path).parent_path();
    std::vector<std::unique_ptr<nlohmann::json>> owned_schemas;
    const auto fetch_doc = [&schema_dir,
                            &owned_schemas](const std::string& uri) -> const nlohmann::json* {
        constexpr std::string_view kSchemaPrefix = "typeguard:schema/";
        if (!uri.starts_with(kSchemaPrefix)) {
            return nullptr;
        }
        const auto name = uri.substr(kSchemaPrefix.size());
        auto fetched = read_schema(schema_dir / (name + ".schema.json"));
        if (!fetched) {
            return nullptr;
        }
        owned_schemas.push_back(std::make_unique<nlohmann::json>(std::move(*fetched)));
        return owned_schemas.back().get();
    };
    // Fetched documents are owned by owned_schemas.
    const auto free_doc = [](const nlohmann::json* /*schema_ptr*/) {};

    try {
        valijson::adapters::NlohmannJsonAdapter schema_adapter(*schema_json);
        parser.populateSchema(schema_adapter, schema, fetch_doc, free_doc);
    } catch (const std::exception& ex) {
        return std::unexpected(Error::make(errc::kSchemaInvalid,
                                           std::string("Failed to build schema: ") + ex.what()));
    }

    valijson::Validator validator;
    valijson::ValidationResults results;
    valijson::adapters::NlohmannJsonAdapter target_adapter(j);

    if (!validator.validate(schema, target_adapter, &results)) {
        std::string error = format_validation_errors(results);
        if (error.empty()) {
            error = "Schema validation failed.";
        }
        return std::unexpected(Error::make(errc::kSchemaInvalid, std::move(error)));
    }

    return {};
}

}  // namespace typeguard::common
