/**
 * @file executor.cpp
 * @brief Runtime executor: fresh context per call, verdict collapse, assertions
 */

#include "typeguard/typeguard.hpp"

#include "typeguard/config.hpp"

namespace typeguard {

namespace {

constexpr const char* kDefaultMessage = "validation failed";

}  // namespace

TypeGuardError::TypeGuardError(Failure failure, const std::string& message)
    : std::runtime_error(message)
    , m_failure(std::move(failure))
{}

typeguard::Result<TypeGuard> TypeGuard::create(const NormalizedType& type)
{
    auto validator = ValidatorCache::global().get_or_compile(type);
    if (!validator) {
        return std::unexpected(validator.error());
    }
    return TypeGuard(std::move(*validator), config::current().short_circuit);
}

TypeGuard::TypeGuard(CompiledValidator validator, bool short_circuit)
    : m_validator(std::move(validator))
    , m_short_circuit(short_circuit)
{}

bool TypeGuard::is(const nlohmann::json& value) const
{
    if (m_short_circuit) {
        return true;
    }
    return !m_validator.validate(
        value, ValidationOptions{.strict = false, .mode = ValidationMode::kBoolean});
}

bool TypeGuard::equals(const nlohmann::json& value) const
{
    if (m_short_circuit) {
        return true;
    }
    return !m_validator.validate(
        value, ValidationOptions{.strict = true, .mode = ValidationMode::kBoolean});
}

Verdict TypeGuard::check(const nlohmann::json& value, bool strict) const
{
    if (m_short_circuit) {
        return std::nullopt;
    }
    return m_validator.validate(
        value, ValidationOptions{.strict = strict, .mode = ValidationMode::kExplain});
}

std::vector<Failure> TypeGuard::diagnose(const nlohmann::json& value, bool strict) const
{
    if (m_short_circuit) {
        return {};
    }
    ValidationContext context(
        ValidationOptions{.strict = strict, .mode = ValidationMode::kDiagnostic});
    static_cast<void>(m_validator.validate(value, context));
    return context.take_diagnostics();
}

const nlohmann::json& TypeGuard::assert_type(const nlohmann::json& value,
                                             const AssertOptions& options) const
{
    return enforce(value, false, options);
}

const nlohmann::json& TypeGuard::assert_equals(const nlohmann::json& value,
                                               const AssertOptions& options) const
{
    return enforce(value, true, options);
}

const nlohmann::json& TypeGuard::enforce(const nlohmann::json& value,
                                         bool strict,
                                         const AssertOptions& options) const
{
    auto verdict = check(value, strict);
    if (!verdict) {
        return value;
    }
    std::string message = options.message
                              ? *options.message
                              : config::render_message(*verdict).value_or(kDefaultMessage);
    throw TypeGuardError(std::move(*verdict), message);
}

// ============================================================================
// Free entry points
// ============================================================================

typeguard::Result<bool> is(const NormalizedType& type, const nlohmann::json& value)
{
    return TypeGuard::create(type).transform(
        [&value](const TypeGuard& guard) { return guard.is(value); });
}

typeguard::Result<bool> equals(const NormalizedType& type, const nlohmann::json& value)
{
    return TypeGuard::create(type).transform(
        [&value](const TypeGuard& guard) { return guard.equals(value); });
}

typeguard::Result<Predicate> create_is(const NormalizedType& type)
{
    return TypeGuard::create(type).transform([](TypeGuard guard) {
        return Predicate([guard = std::move(guard)](const nlohmann::json& value) {
            return guard.is(value);
        });
    });
}

typeguard::Result<Predicate> create_equals(const NormalizedType& type)
{
    return TypeGuard::create(type).transform([](TypeGuard guard) {
        return Predicate([guard = std::move(guard)](const nlohmann::json& value) {
            return guard.equals(value);
        });
    });
}

typeguard::Result<std::reference_wrapper<const nlohmann::json>>
assert_type(const NormalizedType& type, const nlohmann::json& value, const AssertOptions& options)
{
    auto guard = TypeGuard::create(type);
    if (!guard) {
        return std::unexpected(guard.error());
    }
    return std::cref(guard->assert_type(value, options));
}

typeguard::Result<std::reference_wrapper<const nlohmann::json>>
assert_equals(const NormalizedType& type, const nlohmann::json& value, const AssertOptions& options)
{
    auto guard = TypeGuard::create(type);
    if (!guard) {
        return std::unexpected(guard.error());
    }
    return std::cref(guard->assert_equals(value, options));
}

typeguard::Result<Assertion> create_assert_type(const NormalizedType& type, AssertOptions options)
{
    return TypeGuard::create(type).transform([&options](TypeGuard guard) {
        return Assertion([guard = std::move(guard), options = std::move(options)](
                             const nlohmann::json& value) -> const nlohmann::json& {
            return guard.assert_type(value, options);
        });
    });
}

typeguard::Result<Assertion> create_assert_equals(const NormalizedType& type, AssertOptions options)
{
    return TypeGuard::create(type).transform([&options](TypeGuard guard) {
        return Assertion([guard = std::move(guard), options = std::move(options)](
                             const nlohmann::json& value) -> const nlohmann::json& {
            return guard.assert_equals(value, options);
        });
    });
}

typeguard::Result<TypeGuard> make_guard(const DescriptorPtr& descriptor,
                                        const TypeRegistry& registry)
{
    auto normalized = normalize(descriptor, registry);
    if (!normalized) {
        return std::unexpected(normalized.error());
    }
    return TypeGuard::create(*normalized);
}

}  // namespace typeguard
