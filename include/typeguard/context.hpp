#pragma once

/**
 * @file context.hpp
 * @brief Per-call validation state: path tracking, recursion guard, diagnostics
 */

#include "typeguard/failure.hpp"

#include <cstddef>
#include <functional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace typeguard {

enum class ValidationMode {
    kBoolean,     ///< Verdict only; no path bookkeeping
    kExplain,     ///< First failure with its path
    kDiagnostic,  ///< Every failure found
};

struct ValidationOptions
{
    bool strict = false;  ///< Reject superfluous object properties
    ValidationMode mode = ValidationMode::kExplain;
};

/**
 * @brief Set of (definition slot, value identity) pairs currently on the stack
 *
 * Re-entering a pair means the value graph itself is cyclic; the caller
 * treats the re-entry as a pass so validation terminates.
 */
class RecursionGuard
{
public:
    /// @return false when the pair is already active
    [[nodiscard]] bool enter(std::size_t slot, const void* value);
    void leave(std::size_t slot, const void* value);
    [[nodiscard]] bool active(std::size_t slot, const void* value) const;
    [[nodiscard]] std::size_t size() const noexcept { return m_active.size(); }

    class Scope
    {
    public:
        Scope(RecursionGuard& guard, std::size_t slot, const void* value);
        ~Scope();
        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;

        [[nodiscard]] bool entered() const noexcept { return m_entered; }

    private:
        RecursionGuard& m_guard;
        std::size_t m_slot;
        const void* m_value;
        bool m_entered;
    };

private:
    std::set<std::pair<std::size_t, const void*>> m_active;
};

class ValidationContext
{
public:
    explicit ValidationContext(ValidationOptions options = {});

    [[nodiscard]] const ValidationOptions& options() const noexcept { return m_options; }
    [[nodiscard]] bool strict() const noexcept { return m_options.strict; }
    [[nodiscard]] ValidationMode mode() const noexcept { return m_options.mode; }
    [[nodiscard]] bool diagnostic() const noexcept
    {
        return m_options.mode == ValidationMode::kDiagnostic;
    }

    // ------------------------------------------------------------------------
    // Path tracking
    // ------------------------------------------------------------------------

    /// Pops the segment it pushed on destruction.
    class PathScope
    {
    public:
        PathScope(ValidationContext& context, PathSegment segment);
        ~PathScope();
        PathScope(const PathScope&) = delete;
        PathScope& operator=(const PathScope&) = delete;

    private:
        ValidationContext& m_context;
        bool m_counted;
    };

    [[nodiscard]] PathScope at_property(std::string_view key);
    [[nodiscard]] PathScope at_index(std::size_t index);
    [[nodiscard]] PathScope at_branch(std::size_t index);

    /// Structured path; stays empty in boolean mode.
    [[nodiscard]] const std::vector<PathSegment>& path() const noexcept { return m_path; }
    /// Property and index steps from the root, tracked in every mode.
    [[nodiscard]] std::size_t depth() const noexcept { return m_depth; }

    // ------------------------------------------------------------------------
    // Failures
    // ------------------------------------------------------------------------

    /// Failure at the current position, not yet recorded.
    [[nodiscard]] Failure make_failure(FailureKind kind,
                                       std::string_view expected,
                                       std::string_view actual,
                                       std::string_view key = {}) const;

    /// Record the failure (diagnostic mode) and return it as a verdict.
    [[nodiscard]] Verdict report(Failure failure);

    [[nodiscard]] Verdict fail(FailureKind kind,
                               std::string_view expected,
                               std::string_view actual,
                               std::string_view key = {})
    {
        return report(make_failure(kind, expected, actual, key));
    }

    [[nodiscard]] const std::vector<Failure>& diagnostics() const noexcept { return m_diagnostics; }
    [[nodiscard]] std::vector<Failure> take_diagnostics() { return std::move(m_diagnostics); }

    /// Failures inside union branches are tentative and kept out of diagnostics.
    class SuppressRecording
    {
    public:
        explicit SuppressRecording(ValidationContext& context);
        ~SuppressRecording();
        SuppressRecording(const SuppressRecording&) = delete;
        SuppressRecording& operator=(const SuppressRecording&) = delete;

    private:
        ValidationContext& m_context;
    };

    // ------------------------------------------------------------------------
    // Union progress
    // ------------------------------------------------------------------------

    void note_match() noexcept { ++m_matched; }
    [[nodiscard]] std::size_t matched() const noexcept { return m_matched; }
    void set_matched(std::size_t matched) noexcept { m_matched = matched; }

    // ------------------------------------------------------------------------
    // Strictness allowances
    // ------------------------------------------------------------------------

    /// Keys an enclosing intersection declares for one object value.
    class AllowanceScope
    {
    public:
        AllowanceScope(ValidationContext& context,
                       const nlohmann::json* value,
                       const std::set<std::string, std::less<>>* keys);
        ~AllowanceScope();
        AllowanceScope(const AllowanceScope&) = delete;
        AllowanceScope& operator=(const AllowanceScope&) = delete;

    private:
        ValidationContext& m_context;
    };

    [[nodiscard]] bool is_allowed(const nlohmann::json* value, std::string_view key) const;

    [[nodiscard]] RecursionGuard& guard() noexcept { return m_guard; }

private:
    ValidationOptions m_options;
    std::vector<PathSegment> m_path;
    std::size_t m_depth = 0;
    std::vector<Failure> m_diagnostics;
    std::size_t m_suppressed = 0;
    std::size_t m_matched = 0;
    std::vector<std::pair<const nlohmann::json*, const std::set<std::string, std::less<>>*>>
        m_allowances;
    RecursionGuard m_guard;
};

}  // namespace typeguard
