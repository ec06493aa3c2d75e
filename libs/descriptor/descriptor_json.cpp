/**
 * @file descriptor_json.cpp
 * @brief Parsing and serialization of descriptor documents
 */

#include "typeguard/descriptor_json.hpp"

#include "typeguard/json_io.hpp"
#include "typeguard/schema_validate.hpp"
#include "typeguard/version.hpp"

#include <filesystem>
#include <format>

namespace typeguard {

namespace {

using Policy = config::OpaqueTypePolicy;

[[nodiscard]] Error malformed_at(const std::string& where, const std::string& message)
{
    return Error::make(errc::kMalformedDescriptor, std::format("{}: {}", where, message));
}

[[nodiscard]] typeguard::Result<std::string> read_string(const nlohmann::json& node,
                                                         const char* key,
                                                         const std::string& where)
{
    if (!node.contains(key) || !node.at(key).is_string()) {
        return std::unexpected(malformed_at(where, std::format("\"{}\" must be a string", key)));
    }
    return node.at(key).get<std::string>();
}

[[nodiscard]] typeguard::Result<bool> read_flag(const nlohmann::json& node,
                                                const char* key,
                                                const std::string& where)
{
    if (!node.contains(key)) {
        return false;
    }
    if (!node.at(key).is_boolean()) {
        return std::unexpected(malformed_at(where, std::format("\"{}\" must be a boolean", key)));
    }
    return node.at(key).get<bool>();
}

[[nodiscard]] const nlohmann::json* find_array(const nlohmann::json& node, const char* key)
{
    if (!node.contains(key) || !node.at(key).is_array()) {
        return nullptr;
    }
    return &node.at(key);
}

/// Prefix construction errors with the location of the node.
[[nodiscard]] typeguard::Result<DescriptorPtr> located(typeguard::Result<DescriptorPtr> result,
                                                       const std::string& where)
{
    if (!result) {
        return std::unexpected(
            Error::make(result.error().code, std::format("{}: {}", where, result.error().message)));
    }
    return result;
}

class Reader
{
public:
    explicit Reader(Policy policy)
        : m_policy(policy)
    {}

    [[nodiscard]] typeguard::Result<DescriptorPtr> read(const nlohmann::json& node,
                                                        const std::string& where) const
    {
        if (!node.is_object()) {
            return std::unexpected(malformed_at(where, "type node must be an object"));
        }
        auto kind = read_string(node, "kind", where);
        if (!kind) {
            return std::unexpected(kind.error());
        }

        if (auto primitive = primitive_kind_from_string(*kind)) {
            return types::primitive(*primitive);
        }
        if (*kind == "literal") {
            if (!node.contains("value")) {
                return std::unexpected(malformed_at(where, "literal requires \"value\""));
            }
            return located(types::literal(node.at("value")), where);
        }
        if (*kind == "array") {
            if (!node.contains("element")) {
                return std::unexpected(malformed_at(where, "array requires \"element\""));
            }
            auto element = read(node.at("element"), where + "/element");
            if (!element) {
                return element;
            }
            return types::array(*element);
        }
        if (*kind == "tuple") {
            return read_tuple(node, where);
        }
        if (*kind == "object") {
            return read_object(node, where);
        }
        if (*kind == "union" || *kind == "intersection") {
            auto members = read_list(node, "members", where);
            if (!members) {
                return std::unexpected(members.error());
            }
            return *kind == "union" ? types::union_of(std::move(*members))
                                    : types::intersection_of(std::move(*members));
        }
        if (*kind == "reference") {
            return read_string(node, "name", where).transform(
                [](std::string name) { return types::reference(std::move(name)); });
        }
        if (*kind == "instantiate") {
            auto base = read_string(node, "base", where);
            if (!base) {
                return std::unexpected(base.error());
            }
            auto arguments = read_list(node, "arguments", where);
            if (!arguments) {
                return std::unexpected(arguments.error());
            }
            return types::instantiate(std::move(*base), std::move(*arguments));
        }
        if (*kind == "parameter") {
            return read_string(node, "name", where).transform(
                [](std::string name) { return types::parameter(std::move(name)); });
        }
        if (*kind == "function" || *kind == "class") {
            if (m_policy == Policy::kAllow) {
                return types::any();
            }
            return std::unexpected(Error::make(
                errc::kUnsupportedType,
                std::format("{}: {} types carry behavior and cannot be validated at run time",
                            where,
                            *kind)));
        }
        return std::unexpected(malformed_at(where, std::format("unknown kind \"{}\"", *kind)));
    }

private:
    [[nodiscard]] typeguard::Result<std::vector<DescriptorPtr>>
    read_list(const nlohmann::json& node, const char* key, const std::string& where) const
    {
        const auto* items = find_array(node, key);
        if (items == nullptr) {
            return std::unexpected(
                malformed_at(where, std::format("\"{}\" must be an array", key)));
        }
        std::vector<DescriptorPtr> result;
        result.reserve(items->size());
        for (std::size_t i = 0; i < items->size(); ++i) {
            auto parsed = read((*items)[i], std::format("{}/{}/{}", where, key, i));
            if (!parsed) {
                return std::unexpected(parsed.error());
            }
            result.push_back(std::move(*parsed));
        }
        return result;
    }

    [[nodiscard]] typeguard::Result<DescriptorPtr> read_tuple(const nlohmann::json& node,
                                                              const std::string& where) const
    {
        const auto* items = find_array(node, "elements");
        if (items == nullptr) {
            return std::unexpected(malformed_at(where, "\"elements\" must be an array"));
        }
        std::vector<TupleElement> elements;
        for (std::size_t i = 0; i < items->size(); ++i) {
            const auto& item = (*items)[i];
            const std::string item_where = std::format("{}/elements/{}", where, i);
            if (!item.is_object() || !item.contains("type")) {
                return std::unexpected(malformed_at(item_where, "tuple element requires \"type\""));
            }
            auto type = read(item.at("type"), item_where + "/type");
            if (!type) {
                return type;
            }
            auto rest = read_flag(item, "rest", item_where);
            if (!rest) {
                return std::unexpected(rest.error());
            }
            elements.push_back(TupleElement{.type = std::move(*type), .rest = *rest});
        }
        return located(types::tuple(std::move(elements)), where);
    }

    [[nodiscard]] typeguard::Result<DescriptorPtr> read_object(const nlohmann::json& node,
                                                               const std::string& where) const
    {
        std::vector<Property> properties;
        if (node.contains("properties")) {
            const auto* items = find_array(node, "properties");
            if (items == nullptr) {
                return std::unexpected(malformed_at(where, "\"properties\" must be an array"));
            }
            for (std::size_t i = 0; i < items->size(); ++i) {
                const auto& item = (*items)[i];
                const std::string item_where = std::format("{}/properties/{}", where, i);
                if (!item.is_object()) {
                    return std::unexpected(malformed_at(item_where, "property must be an object"));
                }
                auto name = read_string(item, "name", item_where);
                if (!name) {
                    return std::unexpected(name.error());
                }
                if (!item.contains("type")) {
                    return std::unexpected(malformed_at(item_where, "property requires \"type\""));
                }
                auto type = read(item.at("type"), item_where + "/type");
                if (!type) {
                    return type;
                }
                auto optional = read_flag(item, "optional", item_where);
                if (!optional) {
                    return std::unexpected(optional.error());
                }
                auto readonly = read_flag(item, "readonly", item_where);
                if (!readonly) {
                    return std::unexpected(readonly.error());
                }
                properties.push_back(Property{.name = std::move(*name),
                                              .type = std::move(*type),
                                              .optional = *optional,
                                              .readonly = *readonly});
            }
        }

        std::optional<IndexSignature> index;
        if (node.contains("index")) {
            const auto& signature = node.at("index");
            const std::string index_where = where + "/index";
            if (!signature.is_object() || !signature.contains("type")) {
                return std::unexpected(
                    malformed_at(index_where, "index signature requires \"type\""));
            }
            auto key = read_string(signature, "key", index_where);
            if (!key) {
                return std::unexpected(key.error());
            }
            if (*key != "string" && *key != "number") {
                return std::unexpected(
                    malformed_at(index_where, "index key must be \"string\" or \"number\""));
            }
            auto type = read(signature.at("type"), index_where + "/type");
            if (!type) {
                return type;
            }
            index = IndexSignature{
                .key = *key == "string" ? IndexKeyKind::kString : IndexKeyKind::kNumber,
                .type = std::move(*type)};
        }
        return located(types::object(std::move(properties), std::move(index)), where);
    }

    Policy m_policy;
};

[[nodiscard]] nlohmann::json child_to_json(const DescriptorPtr& child)
{
    return child ? descriptor_to_json(*child) : nlohmann::json(nullptr);
}

[[nodiscard]] nlohmann::json list_to_json(const std::vector<DescriptorPtr>& children)
{
    nlohmann::json result = nlohmann::json::array();
    for (const auto& child : children) {
        result.push_back(child_to_json(child));
    }
    return result;
}

}  // namespace

typeguard::Result<DescriptorPtr> descriptor_from_json(const nlohmann::json& node, Policy policy)
{
    return Reader(policy).read(node, "#");
}

nlohmann::json descriptor_to_json(const Descriptor& descriptor)
{
    switch (descriptor.kind()) {
        case DescriptorKind::kPrimitive:
            return {
                {"kind", to_string(descriptor.as<PrimitiveType>()->kind)}
            };
        case DescriptorKind::kLiteral:
            return {
                { "kind",                            "literal"},
                {"value", descriptor.as<LiteralType>()->value}
            };
        case DescriptorKind::kArray:
            return {
                {   "kind",                                         "array"},
                {"element", child_to_json(descriptor.as<ArrayType>()->element)}
            };
        case DescriptorKind::kTuple: {
            const auto& tuple = *descriptor.as<TupleType>();
            nlohmann::json elements = nlohmann::json::array();
            for (const auto& element : tuple.elements) {
                elements.push_back({
                    {"type", child_to_json(element)}
                });
            }
            if (tuple.rest) {
                elements.push_back({
                    {"type", child_to_json(tuple.rest)},
                    {"rest",                      true}
                });
            }
            return {
                {    "kind",  "tuple"},
                {"elements", elements}
            };
        }
        case DescriptorKind::kObject: {
            const auto& object = *descriptor.as<ObjectType>();
            nlohmann::json properties = nlohmann::json::array();
            for (const auto& property : object.properties) {
                nlohmann::json entry = {
                    {"name",               property.name},
                    {"type", child_to_json(property.type)}
                };
                if (property.optional) {
                    entry["optional"] = true;
                }
                if (property.readonly) {
                    entry["readonly"] = true;
                }
                properties.push_back(std::move(entry));
            }
            nlohmann::json result = {
                {      "kind",   "object"},
                {"properties", properties}
            };
            if (object.index) {
                result["index"] = {
                    { "key", object.index->key == IndexKeyKind::kString ? "string" : "number"},
                    {"type",                            child_to_json(object.index->type)}
                };
            }
            return result;
        }
        case DescriptorKind::kUnion:
            return {
                {   "kind",                                           "union"},
                {"members", list_to_json(descriptor.as<UnionType>()->members)}
            };
        case DescriptorKind::kIntersection:
            return {
                {   "kind",                                           "intersection"},
                {"members", list_to_json(descriptor.as<IntersectionType>()->members)}
            };
        case DescriptorKind::kReference:
            return {
                {"kind",                          "reference"},
                {"name", descriptor.as<ReferenceType>()->target}
            };
        case DescriptorKind::kGenericInstantiation: {
            const auto& instance = *descriptor.as<GenericInstantiationType>();
            return {
                {     "kind",                  "instantiate"},
                {     "base",                  instance.base},
                {"arguments", list_to_json(instance.arguments)}
            };
        }
        case DescriptorKind::kTypeParameter:
            return {
                {"kind",                              "parameter"},
                {"name", descriptor.as<TypeParameterType>()->name}
            };
    }
    return nullptr;
}

typeguard::Result<TypeDocument> load_type_document(const nlohmann::json& document, Policy policy)
{
    if (!document.is_object()) {
        return std::unexpected(
            Error::make(errc::kMalformedDescriptor, "descriptor document must be a JSON object"));
    }
    if (document.contains("schema_version")
        && document.at("schema_version") != nlohmann::json(kDescriptorSchemaVersion)) {
        return std::unexpected(
            Error::make(errc::kMalformedDescriptor,
                        std::format("unsupported schema_version {}, expected {}",
                                    document.at("schema_version").dump(),
                                    kDescriptorSchemaVersion)));
    }
    if (!document.contains("root")) {
        return std::unexpected(
            Error::make(errc::kMalformedDescriptor, "descriptor document requires \"root\""));
    }

    const Reader reader(policy);
    TypeDocument result;
    if (document.contains("definitions")) {
        const auto& definitions = document.at("definitions");
        if (!definitions.is_object()) {
            return std::unexpected(
                Error::make(errc::kMalformedDescriptor, "\"definitions\" must be an object"));
        }
        for (const auto& [name, definition] : definitions.items()) {
            const std::string where = "#/definitions/" + name;
            if (!definition.is_object() || !definition.contains("type")) {
                return std::unexpected(malformed_at(where, "definition requires \"type\""));
            }
            std::vector<std::string> parameters;
            if (definition.contains("parameters")) {
                const auto& declared = definition.at("parameters");
                if (!declared.is_array()) {
                    return std::unexpected(
                        malformed_at(where, "\"parameters\" must be an array of strings"));
                }
                for (const auto& parameter : declared) {
                    if (!parameter.is_string()) {
                        return std::unexpected(
                            malformed_at(where, "\"parameters\" must be an array of strings"));
                    }
                    parameters.push_back(parameter.get<std::string>());
                }
            }
            auto body = reader.read(definition.at("type"), where + "/type");
            if (!body) {
                return std::unexpected(body.error());
            }
            if (auto defined =
                    result.registry.define_generic(name, std::move(parameters), std::move(*body));
                !defined) {
                return std::unexpected(defined.error());
            }
        }
    }

    auto root = reader.read(document.at("root"), "#/root");
    if (!root) {
        return std::unexpected(root.error());
    }
    result.root = std::move(*root);
    return result;
}

typeguard::Result<TypeDocument> load_type_document_file(const std::string& path,
                                                        const std::string& schema_dir,
                                                        Policy policy)
{
    auto document = common::read_json_file(path);
    if (!document) {
        return std::unexpected(document.error());
    }
    const auto schema_path =
        (std::filesystem::path(schema_dir) / "descriptor.v1.schema.json").string();
    if (auto valid = common::validate_json(*document, schema_path); !valid) {
        return std::unexpected(Error::make(errc::kSchemaInvalid,
                                           "Descriptor schema invalid: " + valid.error().message));
    }
    return load_type_document(*document, policy);
}

nlohmann::json normalized_to_json(const NormalizedType& type)
{
    nlohmann::json definitions = nlohmann::json::object();
    for (const auto& [id, body] : type.definitions) {
        definitions[id] = child_to_json(body);
    }
    return {
        {"fingerprint",      type.fingerprint},
        {       "root", child_to_json(type.root)},
        {"definitions",            definitions}
    };
}

}  // namespace typeguard
