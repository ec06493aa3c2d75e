/**
 * @file compiler.cpp
 * @brief Validator compiler and compiled-validator cache
 */

#include "typeguard/compiler.hpp"

#include "strictness.hpp"
#include "typeguard/require_cpp23.hpp"
#include "typeguard/value.hpp"

#include <algorithm>
#include <format>
#include <mutex>
#include <ranges>
#include <set>
#include <unordered_map>

namespace typeguard {

namespace {

using Program = CompiledValidator::Program;

[[nodiscard]] bool matches(PrimitiveKind kind, const nlohmann::json& value)
{
    switch (kind) {
        case PrimitiveKind::kString:
            return value.is_string();
        case PrimitiveKind::kNumber:
            return value.is_number();
        case PrimitiveKind::kBoolean:
            return value.is_boolean();
        case PrimitiveKind::kNull:
            return value.is_null();
        case PrimitiveKind::kUndefined:
            return value.is_discarded();
        case PrimitiveKind::kBigInt:
            return is_bigint(value);
        case PrimitiveKind::kAny:
        case PrimitiveKind::kUnknown:
            return true;
        case PrimitiveKind::kNever:
            return false;
    }
    return false;
}

[[nodiscard]] std::string_view kind_of(const nlohmann::json& value)
{
    return to_string(value_kind(value));
}

/// Scalars are shown by value, everything else by kind.
[[nodiscard]] std::string describe(const nlohmann::json& value)
{
    if (value.is_string() || value.is_number() || value.is_boolean()) {
        return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
    return std::string(kind_of(value));
}

struct PropertyCheck
{
    std::string name;
    std::size_t procedure = 0;
    bool optional = false;
    bool admits_undefined = false;
    std::string expected;
};

struct ObjectPlan
{
    std::vector<PropertyCheck> properties;
    std::optional<std::size_t> index;
    strictness::ObjectShape shape;
};

struct UnionPlan
{
    std::vector<std::size_t> members;
    std::string expected;
};

struct IntersectionPlan
{
    std::vector<std::size_t> members;
    std::vector<strictness::KeySet> allowed;  ///< Per member, keys the other members declare
};

class Compiler
{
public:
    Compiler(const NormalizedType& type, Program& program)
        : m_type(type)
        , m_program(program)
    {}

    [[nodiscard]] typeguard::Result<std::size_t> compile_all();

private:
    [[nodiscard]] typeguard::Result<std::size_t> compile_node(const DescriptorPtr& node);
    [[nodiscard]] typeguard::Result<Procedure> lower(const DescriptorPtr& node);
    [[nodiscard]] typeguard::Result<std::vector<std::size_t>>
    compile_members(const std::vector<DescriptorPtr>& members);

    [[nodiscard]] Procedure lower_primitive(PrimitiveKind kind) const;
    [[nodiscard]] typeguard::Result<Procedure> lower_array(const ArrayType& node);
    [[nodiscard]] typeguard::Result<Procedure> lower_tuple(const TupleType& node);
    [[nodiscard]] typeguard::Result<Procedure> lower_object(const ObjectType& node);
    [[nodiscard]] typeguard::Result<Procedure> lower_union(const Descriptor& descriptor,
                                                           const UnionType& node);
    [[nodiscard]] typeguard::Result<Procedure> lower_intersection(const IntersectionType& node);

    [[nodiscard]] bool admits_undefined(const DescriptorPtr& node,
                                        std::set<std::string>& visited) const;

    [[nodiscard]] std::size_t emit(Procedure procedure)
    {
        m_program.procedures.push_back(std::move(procedure));
        return m_program.procedures.size() - 1;
    }

    const NormalizedType& m_type;
    Program& m_program;
    std::unordered_map<const Descriptor*, std::size_t> m_memo;
};

typeguard::Result<std::size_t> Compiler::compile_all()
{
    // Definition slots exist before any body is lowered so references can bind to them.
    for (const auto& [id, body] : m_type.definitions) {
        if (!body) {
            return std::unexpected(Error::make(errc::kMalformedDescriptor,
                                               std::format("definition \"{}\" has no body", id)));
        }
        m_program.slots.emplace(id, emit(Procedure{}));
    }

    for (const auto& [id, body] : m_type.definitions) {
        auto target = compile_node(body);
        if (!target) {
            return target;
        }
        const std::size_t slot = m_program.slots.find(id)->second;
        const std::size_t body_index = *target;
        const Program* self = &m_program;
        m_program.procedures[slot] = [self, slot, body_index](
                                         const nlohmann::json& value,
                                         ValidationContext& context) -> Verdict {
            RecursionGuard::Scope scope(context.guard(), slot, &value);
            if (!scope.entered()) {
                // Same definition on the same value: the value graph is cyclic.
                return std::nullopt;
            }
            return self->procedures[body_index](value, context);
        };
    }

    return compile_node(m_type.root);
}

typeguard::Result<std::size_t> Compiler::compile_node(const DescriptorPtr& node)
{
    if (!node) {
        return std::unexpected(
            Error::make(errc::kMalformedDescriptor, "descriptor node is null"));
    }
    if (auto it = m_memo.find(node.get()); it != m_memo.end()) {
        return it->second;
    }

    if (const auto* reference = node->as<ReferenceType>()) {
        const auto slot = m_program.slots.find(reference->target);
        if (slot == m_program.slots.end()) {
            return std::unexpected(Error::make(
                errc::kUnresolvedReference,
                std::format("reference to \"{}\" has no definition", reference->target)));
        }
        m_memo.emplace(node.get(), slot->second);
        return slot->second;
    }

    auto procedure = lower(node);
    if (!procedure) {
        return std::unexpected(procedure.error());
    }
    const std::size_t index = emit(std::move(*procedure));
    m_memo.emplace(node.get(), index);
    return index;
}

typeguard::Result<std::vector<std::size_t>>
Compiler::compile_members(const std::vector<DescriptorPtr>& members)
{
    std::vector<std::size_t> indices;
    indices.reserve(members.size());
    for (const auto& member : members) {
        auto index = compile_node(member);
        if (!index) {
            return std::unexpected(index.error());
        }
        indices.push_back(*index);
    }
    return indices;
}

typeguard::Result<Procedure> Compiler::lower(const DescriptorPtr& node)
{
    switch (node->kind()) {
        case DescriptorKind::kPrimitive:
            return lower_primitive(node->as<PrimitiveType>()->kind);
        case DescriptorKind::kLiteral:
            return Procedure([expected = node->as<LiteralType>()->value,
                              label = to_string(*node)](const nlohmann::json& value,
                                                        ValidationContext& context) -> Verdict {
                if (value == expected) {
                    return std::nullopt;
                }
                return context.fail(FailureKind::kTypeMismatch, label, describe(value));
            });
        case DescriptorKind::kArray:
            return lower_array(*node->as<ArrayType>());
        case DescriptorKind::kTuple:
            return lower_tuple(*node->as<TupleType>());
        case DescriptorKind::kObject:
            return lower_object(*node->as<ObjectType>());
        case DescriptorKind::kUnion:
            return lower_union(*node, *node->as<UnionType>());
        case DescriptorKind::kIntersection:
            return lower_intersection(*node->as<IntersectionType>());
        case DescriptorKind::kReference:
            break;
        case DescriptorKind::kGenericInstantiation:
            return std::unexpected(Error::make(
                errc::kMalformedDescriptor,
                std::format("generic instantiation {} was not normalized", to_string(*node))));
        case DescriptorKind::kTypeParameter:
            return std::unexpected(Error::make(
                errc::kUnboundTypeParameter,
                std::format("type parameter \"{}\" is not bound",
                            node->as<TypeParameterType>()->name)));
    }
    return std::unexpected(Error::make(errc::kMalformedDescriptor, "unexpected descriptor kind"));
}

Procedure Compiler::lower_primitive(PrimitiveKind kind) const
{
    if (kind == PrimitiveKind::kAny || kind == PrimitiveKind::kUnknown) {
        return [](const nlohmann::json&, ValidationContext&) -> Verdict { return std::nullopt; };
    }
    if (kind == PrimitiveKind::kNever) {
        return [](const nlohmann::json& value, ValidationContext& context) -> Verdict {
            return context.fail(FailureKind::kUnreachable, "never", kind_of(value));
        };
    }
    return [kind](const nlohmann::json& value, ValidationContext& context) -> Verdict {
        if (matches(kind, value)) {
            return std::nullopt;
        }
        return context.fail(FailureKind::kTypeMismatch, to_string(kind), kind_of(value));
    };
}

typeguard::Result<Procedure> Compiler::lower_array(const ArrayType& node)
{
    auto element = compile_node(node.element);
    if (!element) {
        return std::unexpected(element.error());
    }
    const Program* self = &m_program;
    return Procedure([self, element = *element](const nlohmann::json& value,
                                                ValidationContext& context) -> Verdict {
        if (!value.is_array()) {
            return context.fail(FailureKind::kTypeMismatch, "array", kind_of(value));
        }
        Verdict first;
        for (std::size_t i = 0; i < value.size(); ++i) {
            auto scope = context.at_index(i);
            auto verdict = self->procedures[element](value[i], context);
            if (!verdict) {
                context.note_match();
                continue;
            }
            if (!context.diagnostic()) {
                return verdict;
            }
            if (!first) {
                first = std::move(verdict);
            }
        }
        return first;
    });
}

typeguard::Result<Procedure> Compiler::lower_tuple(const TupleType& node)
{
    auto elements = compile_members(node.elements);
    if (!elements) {
        return std::unexpected(elements.error());
    }
    std::optional<std::size_t> rest;
    if (node.rest) {
        auto compiled = compile_node(node.rest);
        if (!compiled) {
            return std::unexpected(compiled.error());
        }
        rest = *compiled;
    }

    const std::string arity = rest ? std::format("tuple of length at least {}", elements->size())
                                   : std::format("tuple of length {}", elements->size());
    const Program* self = &m_program;
    return Procedure([self, elements = std::move(*elements), rest, arity](
                         const nlohmann::json& value, ValidationContext& context) -> Verdict {
        if (!value.is_array()) {
            return context.fail(FailureKind::kTypeMismatch, "tuple", kind_of(value));
        }
        const std::size_t size = value.size();
        if (rest ? size < elements.size() : size != elements.size()) {
            return context.fail(FailureKind::kArityMismatch,
                                arity,
                                std::format("array of length {}", size));
        }
        Verdict first;
        for (std::size_t i = 0; i < size; ++i) {
            const std::size_t procedure = i < elements.size() ? elements[i] : *rest;
            auto scope = context.at_index(i);
            auto verdict = self->procedures[procedure](value[i], context);
            if (!verdict) {
                context.note_match();
                continue;
            }
            if (!context.diagnostic()) {
                return verdict;
            }
            if (!first) {
                first = std::move(verdict);
            }
        }
        return first;
    });
}

typeguard::Result<Procedure> Compiler::lower_object(const ObjectType& node)
{
    auto plan = std::make_shared<ObjectPlan>();
    plan->shape = strictness::shape_of(node);
    for (const auto& property : node.properties) {
        auto procedure = compile_node(property.type);
        if (!procedure) {
            return std::unexpected(procedure.error());
        }
        std::set<std::string> visited;
        plan->properties.push_back(PropertyCheck{.name = property.name,
                                                 .procedure = *procedure,
                                                 .optional = property.optional,
                                                 .admits_undefined =
                                                     admits_undefined(property.type, visited),
                                                 .expected = to_string(*property.type)});
    }
    if (node.index) {
        auto procedure = compile_node(node.index->type);
        if (!procedure) {
            return std::unexpected(procedure.error());
        }
        plan->index = *procedure;
    }

    const Program* self = &m_program;
    return Procedure([self, plan = std::shared_ptr<const ObjectPlan>(std::move(plan))](
                         const nlohmann::json& value, ValidationContext& context) -> Verdict {
        if (!value.is_object()) {
            return context.fail(FailureKind::kTypeMismatch, "object", kind_of(value));
        }
        const bool diagnostic = context.diagnostic();
        Verdict first;
        const auto keep = [&first](Verdict verdict) {
            if (!first) {
                first = std::move(verdict);
            }
        };

        for (const auto& property : plan->properties) {
            const auto it = value.find(property.name);
            const bool absent = it == value.end() || (property.optional && it->is_discarded());
            if (absent) {
                if (property.optional || property.admits_undefined) {
                    continue;
                }
                auto scope = context.at_property(property.name);
                auto verdict = context.fail(
                    FailureKind::kMissingProperty, property.expected, "undefined", property.name);
                if (!diagnostic) {
                    return verdict;
                }
                keep(std::move(verdict));
                continue;
            }
            auto scope = context.at_property(property.name);
            auto verdict = self->procedures[property.procedure](*it, context);
            if (!verdict) {
                context.note_match();
                continue;
            }
            if (!diagnostic) {
                return verdict;
            }
            keep(std::move(verdict));
        }

        if (plan->index) {
            for (const auto& entry : value.items()) {
                const std::string& key = entry.key();
                if (plan->shape.declared.contains(key) || !plan->shape.covers(key)) {
                    continue;
                }
                auto scope = context.at_property(key);
                auto verdict = self->procedures[*plan->index](entry.value(), context);
                if (!verdict) {
                    context.note_match();
                    continue;
                }
                if (!diagnostic) {
                    return verdict;
                }
                keep(std::move(verdict));
            }
        }

        if (context.strict()) {
            for (const auto& key :
                 strictness::superfluous_keys(value, plan->shape, context, diagnostic)) {
                auto scope = context.at_property(key);
                auto verdict = context.fail(FailureKind::kSuperfluousProperty, "", "", key);
                if (!diagnostic) {
                    return verdict;
                }
                keep(std::move(verdict));
            }
        }
        return first;
    });
}

typeguard::Result<Procedure> Compiler::lower_union(const Descriptor& descriptor,
                                                   const UnionType& node)
{
    auto members = compile_members(node.members);
    if (!members) {
        return std::unexpected(members.error());
    }
    auto plan = std::make_shared<const UnionPlan>(
        UnionPlan{.members = std::move(*members), .expected = to_string(descriptor)});

    const Program* self = &m_program;
    return Procedure([self, plan](const nlohmann::json& value,
                                  ValidationContext& context) -> Verdict {
        if (context.mode() == ValidationMode::kBoolean) {
            for (const std::size_t member : plan->members) {
                if (!self->procedures[member](value, context)) {
                    return std::nullopt;
                }
            }
            return context.fail(FailureKind::kNoUnionMemberMatched, plan->expected, kind_of(value));
        }

        // Rank branch failures: deepest failure, then branch progress, then declaration order.
        const std::size_t base = context.matched();
        std::optional<Failure> best;
        std::size_t best_progress = 0;
        std::size_t best_branch = 0;
        {
            ValidationContext::SuppressRecording suppress(context);
            for (auto [i, member] : std::views::enumerate(plan->members)) {
                context.set_matched(base);
                Verdict verdict;
                {
                    auto scope = context.at_branch(static_cast<std::size_t>(i));
                    verdict = self->procedures[member](value, context);
                }
                if (!verdict) {
                    return std::nullopt;
                }
                const std::size_t progress = context.matched() - base;
                const std::size_t specificity = verdict->specificity();
                if (!best || specificity > best->specificity()
                    || (specificity == best->specificity() && progress > best_progress)) {
                    best = std::move(*verdict);
                    best_progress = progress;
                    best_branch = static_cast<std::size_t>(i);
                }
            }
        }
        context.set_matched(base);

        Failure failure = context.make_failure(
            FailureKind::kNoUnionMemberMatched, plan->expected, kind_of(value));
        failure.branch = best_branch;
        if (best) {
            failure.cause = std::make_shared<const Failure>(std::move(*best));
        }
        return context.report(std::move(failure));
    });
}

typeguard::Result<Procedure> Compiler::lower_intersection(const IntersectionType& node)
{
    auto members = compile_members(node.members);
    if (!members) {
        return std::unexpected(members.error());
    }
    auto plan = std::make_shared<const IntersectionPlan>(
        IntersectionPlan{.members = std::move(*members),
                         .allowed = strictness::allowed_keys(node.members, m_type.definitions)});

    const Program* self = &m_program;
    return Procedure([self, plan](const nlohmann::json& value,
                                  ValidationContext& context) -> Verdict {
        Verdict first;
        for (std::size_t i = 0; i < plan->members.size(); ++i) {
            const auto& keys = plan->allowed[i];
            std::optional<ValidationContext::AllowanceScope> allowance;
            if (context.strict() && value.is_object() && !keys.empty()) {
                allowance.emplace(context, &value, &keys);
            }
            auto verdict = self->procedures[plan->members[i]](value, context);
            if (!verdict) {
                continue;
            }
            if (!context.diagnostic()) {
                return verdict;
            }
            if (!first) {
                first = std::move(verdict);
            }
        }
        return first;
    });
}

bool Compiler::admits_undefined(const DescriptorPtr& node, std::set<std::string>& visited) const
{
    if (const auto* primitive = node->as<PrimitiveType>()) {
        return primitive->kind == PrimitiveKind::kUndefined
               || primitive->kind == PrimitiveKind::kAny
               || primitive->kind == PrimitiveKind::kUnknown;
    }
    if (const auto* alternatives = node->as<UnionType>()) {
        return std::ranges::any_of(alternatives->members, [&](const DescriptorPtr& member) {
            return admits_undefined(member, visited);
        });
    }
    if (const auto* intersection = node->as<IntersectionType>()) {
        return std::ranges::all_of(intersection->members, [&](const DescriptorPtr& member) {
            return admits_undefined(member, visited);
        });
    }
    if (const auto* reference = node->as<ReferenceType>()) {
        const auto it = m_type.definitions.find(reference->target);
        if (it == m_type.definitions.end() || !visited.insert(reference->target).second) {
            return false;
        }
        return admits_undefined(it->second, visited);
    }
    return false;
}

}  // namespace

// ============================================================================
// CompiledValidator
// ============================================================================

CompiledValidator::CompiledValidator(std::shared_ptr<const Program> program,
                                     std::string fingerprint)
    : m_program(std::move(program))
    , m_fingerprint(std::move(fingerprint))
{}

Verdict CompiledValidator::validate(const nlohmann::json& value, ValidationContext& context) const
{
    return m_program->procedures[m_program->root](value, context);
}

Verdict CompiledValidator::validate(const nlohmann::json& value,
                                    const ValidationOptions& options) const
{
    ValidationContext context(options);
    return validate(value, context);
}

std::optional<std::size_t> CompiledValidator::definition_slot(std::string_view id) const
{
    const auto it = m_program->slots.find(id);
    if (it == m_program->slots.end()) {
        return std::nullopt;
    }
    return it->second;
}

typeguard::Result<CompiledValidator> compile(const NormalizedType& type)
{
    auto program = std::make_shared<CompiledValidator::Program>();
    Compiler compiler(type, *program);
    auto root = compiler.compile_all();
    if (!root) {
        return std::unexpected(root.error());
    }
    program->root = *root;
    return CompiledValidator(std::move(program), type.fingerprint);
}

// ============================================================================
// ValidatorCache
// ============================================================================

typeguard::Result<CompiledValidator> ValidatorCache::get_or_compile(const NormalizedType& type)
{
    if (auto cached = find(type.fingerprint)) {
        return *std::move(cached);
    }

    auto compiled = compile(type);
    if (!compiled) {
        return std::unexpected(compiled.error());
    }

    std::unique_lock lock(m_mutex);
    const auto it = m_entries.try_emplace(type.fingerprint, std::move(*compiled)).first;
    return it->second;
}

std::optional<CompiledValidator> ValidatorCache::find(std::string_view fingerprint) const
{
    std::shared_lock lock(m_mutex);
    const auto it = m_entries.find(fingerprint);
    if (it == m_entries.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t ValidatorCache::size() const
{
    std::shared_lock lock(m_mutex);
    return m_entries.size();
}

void ValidatorCache::clear()
{
    std::unique_lock lock(m_mutex);
    m_entries.clear();
}

ValidatorCache& ValidatorCache::global()
{
    static ValidatorCache cache;
    return cache;
}

}  // namespace typeguard
