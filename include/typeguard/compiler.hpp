#pragma once

/**
 * @file compiler.hpp
 * @brief Lowering of normalized descriptors into validation procedures
 */

#include "typeguard/common.hpp"
#include "typeguard/context.hpp"
#include "typeguard/failure.hpp"
#include "typeguard/normalizer.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace typeguard {

using Procedure = std::function<Verdict(const nlohmann::json&, ValidationContext&)>;

/**
 * @brief Immutable compiled validator
 *
 * Procedures live in an arena shared by all copies and refer to each other
 * by index, so recursive definitions compile to a call into their own slot.
 * Safe to invoke concurrently; each call owns its ValidationContext.
 */
class CompiledValidator
{
public:
    struct Program
    {
        std::vector<Procedure> procedures;
        std::map<std::string, std::size_t, std::less<>> slots;  ///< Definition id -> slot
        std::size_t root = 0;
    };

    CompiledValidator(std::shared_ptr<const Program> program, std::string fingerprint);

    [[nodiscard]] Verdict validate(const nlohmann::json& value, ValidationContext& context) const;
    [[nodiscard]] Verdict validate(const nlohmann::json& value,
                                   const ValidationOptions& options = {}) const;

    /// Fingerprint of the normalized type this validator was built from.
    [[nodiscard]] const std::string& fingerprint() const noexcept { return m_fingerprint; }

    /// Recursion-guard slot of a recursive definition.
    [[nodiscard]] std::optional<std::size_t> definition_slot(std::string_view id) const;

    [[nodiscard]] std::size_t procedure_count() const noexcept
    {
        return m_program->procedures.size();
    }

private:
    std::shared_ptr<const Program> m_program;
    std::string m_fingerprint;
};

/**
 * Compile a normalized type.
 *
 * Fails with UnresolvedReference when a reference names no definition and
 * with UnboundTypeParameter or MalformedDescriptor when the graph is not
 * closed; neither happens for the output of normalize().
 */
[[nodiscard]] typeguard::Result<CompiledValidator> compile(const NormalizedType& type);

/**
 * @brief Compiled validators keyed by normalized-type fingerprint
 *
 * Readers share the lock; a miss compiles outside the lock and the first
 * writer's validator is kept.
 */
class ValidatorCache
{
public:
    [[nodiscard]] typeguard::Result<CompiledValidator> get_or_compile(const NormalizedType& type);
    [[nodiscard]] std::optional<CompiledValidator> find(std::string_view fingerprint) const;
    [[nodiscard]] std::size_t size() const;
    void clear();

    /// Process-wide cache used by the entry points.
    [[nodiscard]] static ValidatorCache& global();

private:
    mutable std::shared_mutex m_mutex;
    std::map<std::string, CompiledValidator, std::less<>> m_entries;
};

}  // namespace typeguard
