/**
 * @file normalizer.cpp
 * @brief Reference resolution, generic substitution and deduplication
 */

#include "typeguard/normalizer.hpp"

#include "typeguard/canonical_json.hpp"

#include <algorithm>
#include <format>
#include <ranges>
#include <set>
#include <unordered_set>

namespace typeguard {

namespace {

/// Counts structural steps (element, property, index signature) on the current path.
class DescentScope
{
public:
    explicit DescentScope(std::size_t& descent)
        : m_descent(descent)
    {
        ++m_descent;
    }
    ~DescentScope() { --m_descent; }
    DescentScope(const DescentScope&) = delete;
    DescentScope& operator=(const DescentScope&) = delete;

private:
    std::size_t& m_descent;
};

[[nodiscard]] Error malformed(std::string message)
{
    return Error::make(errc::kMalformedDescriptor, std::move(message));
}

[[nodiscard]] Error cyclic(const std::string& id)
{
    return Error::make(errc::kCyclicWithoutReference,
                       std::format("type \"{}\" refers to itself without a property, element or "
                                   "index step in between",
                                   id));
}

[[nodiscard]] Error unbound(const std::string& name)
{
    return Error::make(errc::kUnboundTypeParameter,
                       std::format("type parameter \"{}\" is not bound", name));
}

[[nodiscard]] bool is_top(const DescriptorPtr& node)
{
    return node->is_primitive(PrimitiveKind::kAny) || node->is_primitive(PrimitiveKind::kUnknown);
}

}  // namespace

// ============================================================================
// TypeRegistry
// ============================================================================

typeguard::VoidResult TypeRegistry::define(std::string name, DescriptorPtr body)
{
    return define_generic(std::move(name), {}, std::move(body));
}

typeguard::VoidResult TypeRegistry::define_generic(std::string name,
                                                   std::vector<std::string> parameters,
                                                   DescriptorPtr body)
{
    if (name.empty()) {
        return std::unexpected(malformed("definition name is empty"));
    }
    if (!body) {
        return std::unexpected(malformed(std::format("definition \"{}\" has no body", name)));
    }
    if (m_definitions.contains(name)) {
        return std::unexpected(malformed(std::format("type \"{}\" is defined twice", name)));
    }
    std::unordered_set<std::string_view> seen;
    for (const auto& parameter : parameters) {
        if (parameter.empty() || !seen.insert(parameter).second) {
            return std::unexpected(malformed(
                std::format("type \"{}\" declares parameter \"{}\" more than once or unnamed",
                            name,
                            parameter)));
        }
    }
    m_definitions.emplace(std::move(name),
                          Definition{.parameters = std::move(parameters), .body = std::move(body)});
    return {};
}

const Definition* TypeRegistry::find(std::string_view name) const
{
    const auto it = m_definitions.find(name);
    return it == m_definitions.end() ? nullptr : &it->second;
}

// ============================================================================
// Normalizer
// ============================================================================

Normalizer::Normalizer(const TypeRegistry& registry)
    : m_registry(registry)
{}

typeguard::Result<NormalizedType> Normalizer::run(const DescriptorPtr& root)
{
    m_entries.clear();
    m_by_id.clear();
    m_ids.clear();
    m_definitions.clear();
    m_interned.clear();
    m_descent = 0;
    m_instantiations = 0;

    auto normalized = visit(root, Environment{});
    if (!normalized) {
        return std::unexpected(normalized.error());
    }

    nlohmann::json definitions = nlohmann::json::object();
    for (const auto& [id, body] : m_definitions) {
        definitions[id] = body->fingerprint();
    }
    const nlohmann::json shape = {
        {       "root", (*normalized)->fingerprint()},
        {"definitions",                  definitions}
    };
    auto fingerprint = canonical::hash_canonical(shape);
    if (!fingerprint) {
        return std::unexpected(fingerprint.error());
    }

    return NormalizedType{.root = *normalized,
                          .definitions = std::move(m_definitions),
                          .fingerprint = std::move(*fingerprint)};
}

typeguard::Result<DescriptorPtr> Normalizer::visit_child(const DescriptorPtr& node,
                                                         const Environment& env)
{
    DescentScope scope(m_descent);
    return visit(node, env);
}

typeguard::Result<DescriptorPtr> Normalizer::visit(const DescriptorPtr& node,
                                                   const Environment& env)
{
    if (!node) {
        return std::unexpected(malformed("descriptor node is null"));
    }

    switch (node->kind()) {
        case DescriptorKind::kPrimitive:
        case DescriptorKind::kLiteral:
            return intern(node);

        case DescriptorKind::kArray: {
            auto element = visit_child(node->as<ArrayType>()->element, env);
            if (!element) {
                return element;
            }
            return intern(types::array(*element));
        }

        case DescriptorKind::kTuple: {
            const auto& tuple = *node->as<TupleType>();
            TupleType result;
            for (const auto& element : tuple.elements) {
                auto normalized = visit_child(element, env);
                if (!normalized) {
                    return normalized;
                }
                result.elements.push_back(*normalized);
            }
            if (tuple.rest) {
                auto rest = visit_child(tuple.rest, env);
                if (!rest) {
                    return rest;
                }
                result.rest = *rest;
            }
            auto made = Descriptor::make(std::move(result));
            if (!made) {
                return made;
            }
            return intern(*made);
        }

        case DescriptorKind::kObject: {
            const auto& object = *node->as<ObjectType>();
            ObjectType result;
            result.properties.reserve(object.properties.size());
            for (const auto& property : object.properties) {
                auto type = visit_child(property.type, env);
                if (!type) {
                    return std::unexpected(Error::make(
                        type.error().code,
                        std::format("property \"{}\": {}", property.name, type.error().message)));
                }
                result.properties.push_back(Property{.name = property.name,
                                                     .type = *type,
                                                     .optional = property.optional,
                                                     .readonly = property.readonly});
            }
            if (object.index) {
                auto type = visit_child(object.index->type, env);
                if (!type) {
                    return type;
                }
                result.index = IndexSignature{.key = object.index->key, .type = *type};
            }
            auto made = Descriptor::make(std::move(result));
            if (!made) {
                return made;
            }
            return intern(*made);
        }

        case DescriptorKind::kUnion:
            return visit_union(*node->as<UnionType>(), env);

        case DescriptorKind::kIntersection:
            return visit_intersection(*node->as<IntersectionType>(), env);

        case DescriptorKind::kReference:
            return resolve(node->as<ReferenceType>()->target, {});

        case DescriptorKind::kGenericInstantiation: {
            // Arguments stay unresolved until the parameter is used, so a cycle
            // through an argument is judged at the use site.
            const auto& instance = *node->as<GenericInstantiationType>();
            std::vector<DescriptorPtr> arguments;
            arguments.reserve(instance.arguments.size());
            for (const auto& argument : instance.arguments) {
                auto closed = substitute(argument, env);
                if (!closed) {
                    return closed;
                }
                arguments.push_back(*closed);
            }
            return resolve(instance.base, arguments);
        }

        case DescriptorKind::kTypeParameter: {
            const auto& name = node->as<TypeParameterType>()->name;
            const auto it = env.find(name);
            if (it == env.end()) {
                return std::unexpected(unbound(name));
            }
            return visit(it->second, Environment{});
        }
    }
    return std::unexpected(malformed("unknown descriptor kind"));
}

typeguard::Result<DescriptorPtr> Normalizer::substitute(const DescriptorPtr& node,
                                                        const Environment& env)
{
    if (!node) {
        return std::unexpected(malformed("descriptor node is null"));
    }

    const auto substitute_all = [&env](const std::vector<DescriptorPtr>& nodes)
        -> typeguard::Result<std::vector<DescriptorPtr>> {
        std::vector<DescriptorPtr> result;
        result.reserve(nodes.size());
        for (const auto& item : nodes) {
            auto closed = substitute(item, env);
            if (!closed) {
                return std::unexpected(closed.error());
            }
            result.push_back(*closed);
        }
        return result;
    };

    switch (node->kind()) {
        case DescriptorKind::kPrimitive:
        case DescriptorKind::kLiteral:
        case DescriptorKind::kReference:
            return node;

        case DescriptorKind::kArray: {
            auto element = substitute(node->as<ArrayType>()->element, env);
            if (!element) {
                return element;
            }
            return types::array(*element);
        }

        case DescriptorKind::kTuple: {
            const auto& tuple = *node->as<TupleType>();
            auto elements = substitute_all(tuple.elements);
            if (!elements) {
                return std::unexpected(elements.error());
            }
            TupleType result{.elements = std::move(*elements), .rest = nullptr};
            if (tuple.rest) {
                auto rest = substitute(tuple.rest, env);
                if (!rest) {
                    return rest;
                }
                result.rest = *rest;
            }
            return Descriptor::make(std::move(result));
        }

        case DescriptorKind::kObject: {
            const auto& object = *node->as<ObjectType>();
            ObjectType result;
            result.properties.reserve(object.properties.size());
            for (const auto& property : object.properties) {
                auto type = substitute(property.type, env);
                if (!type) {
                    return type;
                }
                result.properties.push_back(Property{.name = property.name,
                                                     .type = *type,
                                                     .optional = property.optional,
                                                     .readonly = property.readonly});
            }
            if (object.index) {
                auto type = substitute(object.index->type, env);
                if (!type) {
                    return type;
                }
                result.index = IndexSignature{.key = object.index->key, .type = *type};
            }
            return Descriptor::make(std::move(result));
        }

        case DescriptorKind::kUnion: {
            auto members = substitute_all(node->as<UnionType>()->members);
            if (!members) {
                return std::unexpected(members.error());
            }
            return types::union_of(std::move(*members));
        }

        case DescriptorKind::kIntersection: {
            auto members = substitute_all(node->as<IntersectionType>()->members);
            if (!members) {
                return std::unexpected(members.error());
            }
            return types::intersection_of(std::move(*members));
        }

        case DescriptorKind::kGenericInstantiation: {
            const auto& instance = *node->as<GenericInstantiationType>();
            auto arguments = substitute_all(instance.arguments);
            if (!arguments) {
                return std::unexpected(arguments.error());
            }
            return types::instantiate(instance.base, std::move(*arguments));
        }

        case DescriptorKind::kTypeParameter: {
            const auto& name = node->as<TypeParameterType>()->name;
            const auto it = env.find(name);
            if (it == env.end()) {
                return std::unexpected(unbound(name));
            }
            return it->second;
        }
    }
    return std::unexpected(malformed("unknown descriptor kind"));
}

typeguard::Result<DescriptorPtr> Normalizer::visit_union(const UnionType& node,
                                                         const Environment& env)
{
    std::vector<DescriptorPtr> members;
    const auto add = [&members](const DescriptorPtr& member) {
        if (member->is_primitive(PrimitiveKind::kNever)) {
            return;
        }
        // Interned nodes are equivalent iff they are the same pointer.
        if (std::ranges::find(members, member) == members.end()) {
            members.push_back(member);
        }
    };

    for (const auto& member : node.members) {
        auto normalized = visit(member, env);
        if (!normalized) {
            return normalized;
        }
        if (const auto* nested = (*normalized)->as<UnionType>()) {
            std::ranges::for_each(nested->members, add);
        } else {
            add(*normalized);
        }
    }

    if (members.empty()) {
        return intern(types::never());
    }
    if (members.size() == 1) {
        return members.front();
    }
    return intern(types::union_of(std::move(members)));
}

typeguard::Result<DescriptorPtr> Normalizer::visit_intersection(const IntersectionType& node,
                                                                const Environment& env)
{
    std::vector<DescriptorPtr> members;
    const auto add = [&members](const DescriptorPtr& member) {
        if (is_top(member)) {
            return;
        }
        if (std::ranges::find(members, member) == members.end()) {
            members.push_back(member);
        }
    };

    for (const auto& member : node.members) {
        auto normalized = visit(member, env);
        if (!normalized) {
            return normalized;
        }
        if (const auto* nested = (*normalized)->as<IntersectionType>()) {
            std::ranges::for_each(nested->members, add);
        } else {
            add(*normalized);
        }
    }

    if (members.empty()) {
        return intern(types::unknown());
    }
    if (members.size() == 1) {
        return members.front();
    }
    return intern(types::intersection_of(std::move(members)));
}

typeguard::Result<DescriptorPtr> Normalizer::resolve(const std::string& name,
                                                     const std::vector<DescriptorPtr>& arguments)
{
    const Definition* definition = m_registry.find(name);
    if (definition == nullptr) {
        return std::unexpected(Error::make(errc::kUnresolvedReference,
                                           std::format("type \"{}\" is not defined", name)));
    }
    if (definition->parameters.size() != arguments.size()) {
        return std::unexpected(
            malformed(std::format("type \"{}\" expects {} type argument(s), got {}",
                                  name,
                                  definition->parameters.size(),
                                  arguments.size())));
    }

    std::string key = name;
    for (const auto& argument : arguments) {
        key += "|" + argument->fingerprint();
    }

    if (auto it = m_entries.find(key); it != m_entries.end()) {
        Entry& entry = it->second;
        if (entry.state == State::kInProgress) {
            if (entry.descent == m_descent) {
                return std::unexpected(cyclic(entry.id));
            }
            entry.recursive = true;
            return intern(types::reference(entry.id));
        }
        auto result = entry.recursive ? intern(types::reference(entry.id)) : entry.body;
        if (auto guarded = check_guarded(result); !guarded) {
            return std::unexpected(guarded.error());
        }
        return result;
    }

    const bool generic = !arguments.empty();
    if (generic && m_instantiations >= kMaxInstantiationDepth) {
        return std::unexpected(Error::make(
            errc::kInstantiationTooDeep,
            std::format("instantiation of \"{}\" exceeds {} nested levels; the generic "
                        "expansion does not close",
                        name,
                        kMaxInstantiationDepth)));
    }

    Environment env;
    for (auto [parameter, argument] : std::views::zip(definition->parameters, arguments)) {
        env.emplace(parameter, argument);
    }

    const auto it =
        m_entries.emplace(key, Entry{.id = make_id(name, arguments), .descent = m_descent}).first;
    m_by_id.emplace(it->second.id, &it->second);

    if (generic) {
        ++m_instantiations;
    }
    auto body = visit(definition->body, env);
    if (generic) {
        --m_instantiations;
    }
    if (!body) {
        return body;
    }

    Entry& entry = it->second;
    entry.state = State::kDone;
    entry.body = *body;
    if (!entry.recursive) {
        return entry.body;
    }
    m_definitions.emplace(entry.id, entry.body);
    return intern(types::reference(entry.id));
}

typeguard::VoidResult Normalizer::check_guarded(const DescriptorPtr& node) const
{
    std::vector<DescriptorPtr> pending{node};
    std::set<std::string> visited;
    while (!pending.empty()) {
        const DescriptorPtr current = std::move(pending.back());
        pending.pop_back();
        if (const auto* members = current->as<UnionType>()) {
            pending.insert(pending.end(), members->members.begin(), members->members.end());
            continue;
        }
        if (const auto* members = current->as<IntersectionType>()) {
            pending.insert(pending.end(), members->members.begin(), members->members.end());
            continue;
        }
        const auto* reference = current->as<ReferenceType>();
        if (reference == nullptr || !visited.insert(reference->target).second) {
            continue;
        }
        const auto it = m_by_id.find(reference->target);
        if (it == m_by_id.end()) {
            continue;
        }
        const Entry& entry = *it->second;
        if (entry.state == State::kInProgress) {
            if (entry.descent == m_descent) {
                return std::unexpected(cyclic(entry.id));
            }
        } else if (entry.body) {
            pending.push_back(entry.body);
        }
    }
    return {};
}

std::string Normalizer::make_id(const std::string& name,
                                const std::vector<DescriptorPtr>& arguments)
{
    std::string id = name;
    if (!arguments.empty()) {
        id += "<";
        for (auto [i, argument] : std::views::enumerate(arguments)) {
            if (i > 0) {
                id += ", ";
            }
            id += to_string(*argument);
        }
        id += ">";
    }
    std::string candidate = id;
    for (std::size_t n = 2; !m_ids.insert(candidate).second; ++n) {
        candidate = std::format("{}#{}", id, n);
    }
    return candidate;
}

DescriptorPtr Normalizer::intern(DescriptorPtr node)
{
    auto& bucket = m_interned[node->fingerprint()];
    for (const auto& existing : bucket) {
        if (existing->equivalent(*node)) {
            return existing;
        }
    }
    bucket.push_back(node);
    return node;
}

typeguard::Result<NormalizedType> normalize(const DescriptorPtr& root, const TypeRegistry& registry)
{
    Normalizer normalizer(registry);
    return normalizer.run(root);
}

}  // namespace typeguard
