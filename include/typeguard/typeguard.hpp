#pragma once

/**
 * @file typeguard.hpp
 * @brief Validation entry points: boolean checks, equality checks, assertions
 *
 * Every entry point is bound to a normalized type. Boolean and equality
 * checks never throw for a mismatching value; assertions throw
 * TypeGuardError. Construction problems are reported through Result.
 */

#include "typeguard/common.hpp"
#include "typeguard/compiler.hpp"
#include "typeguard/context.hpp"
#include "typeguard/failure.hpp"
#include "typeguard/normalizer.hpp"

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace typeguard {

/**
 * @brief Thrown by assertions when a value does not conform
 */
class TypeGuardError : public std::runtime_error
{
public:
    TypeGuardError(Failure failure, const std::string& message);

    [[nodiscard]] const Failure& failure() const noexcept { return m_failure; }

private:
    Failure m_failure;
};

struct AssertOptions
{
    /// Replaces the rendered failure message in the thrown error.
    std::optional<std::string> message;
};

/**
 * @brief Entry points pre-bound to one compiled type
 *
 * The short-circuit setting is read once, when the guard is created.
 */
class TypeGuard
{
public:
    /// Compile through the global cache and snapshot the settings.
    [[nodiscard]] static typeguard::Result<TypeGuard> create(const NormalizedType& type);

    TypeGuard(CompiledValidator validator, bool short_circuit);

    [[nodiscard]] bool is(const nlohmann::json& value) const;
    [[nodiscard]] bool equals(const nlohmann::json& value) const;

    /// First failure with its path, or empty on Pass.
    [[nodiscard]] Verdict check(const nlohmann::json& value, bool strict = false) const;

    /// Every failure found; failures inside union branches are folded into the union's.
    [[nodiscard]] std::vector<Failure> diagnose(const nlohmann::json& value,
                                                bool strict = false) const;

    /// @return value, unchanged
    /// @throws TypeGuardError
    const nlohmann::json& assert_type(const nlohmann::json& value,
                                      const AssertOptions& options = {}) const;
    const nlohmann::json& assert_equals(const nlohmann::json& value,
                                        const AssertOptions& options = {}) const;

    [[nodiscard]] const CompiledValidator& validator() const noexcept { return m_validator; }
    [[nodiscard]] bool short_circuit() const noexcept { return m_short_circuit; }

private:
    const nlohmann::json& enforce(const nlohmann::json& value,
                                  bool strict,
                                  const AssertOptions& options) const;

    CompiledValidator m_validator;
    bool m_short_circuit;
};

using Predicate = std::function<bool(const nlohmann::json&)>;
using Assertion = std::function<const nlohmann::json&(const nlohmann::json&)>;

[[nodiscard]] typeguard::Result<bool> is(const NormalizedType& type, const nlohmann::json& value);
[[nodiscard]] typeguard::Result<bool> equals(const NormalizedType& type,
                                             const nlohmann::json& value);
[[nodiscard]] typeguard::Result<Predicate> create_is(const NormalizedType& type);
[[nodiscard]] typeguard::Result<Predicate> create_equals(const NormalizedType& type);

/// @throws TypeGuardError when the value does not conform
[[nodiscard]] typeguard::Result<std::reference_wrapper<const nlohmann::json>>
assert_type(const NormalizedType& type,
            const nlohmann::json& value,
            const AssertOptions& options = {});
[[nodiscard]] typeguard::Result<std::reference_wrapper<const nlohmann::json>>
assert_equals(const NormalizedType& type,
              const nlohmann::json& value,
              const AssertOptions& options = {});
[[nodiscard]] typeguard::Result<Assertion> create_assert_type(const NormalizedType& type,
                                                              AssertOptions options = {});
[[nodiscard]] typeguard::Result<Assertion> create_assert_equals(const NormalizedType& type,
                                                                AssertOptions options = {});

/// Normalize a descriptor against a registry and bind a guard to it.
[[nodiscard]] typeguard::Result<TypeGuard> make_guard(const DescriptorPtr& descriptor,
                                                      const TypeRegistry& registry = {});

}  // namespace typeguard
