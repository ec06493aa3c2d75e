#pragma once

/**
 * @file failure.hpp
 * @brief Validation failures, failure paths and their rendering
 */

#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace typeguard {

enum class FailureKind {
    kTypeMismatch,
    kMissingProperty,
    kSuperfluousProperty,
    kArityMismatch,
    kNoUnionMemberMatched,
    kUnreachable
};

/**
 * @brief One navigation step from the validated root
 *
 * Branch segments record which union member was being tried; they are part
 * of the structured path but not of the rendered one.
 */
struct PathSegment
{
    enum class Kind { kProperty, kIndex, kBranch };

    Kind kind = Kind::kProperty;
    std::string key;
    std::size_t index = 0;

    [[nodiscard]] static PathSegment property(std::string key);
    [[nodiscard]] static PathSegment element(std::size_t index);
    [[nodiscard]] static PathSegment branch(std::size_t index);

    friend bool operator==(const PathSegment&, const PathSegment&) = default;
};

struct Failure
{
    FailureKind kind = FailureKind::kTypeMismatch;
    /// Empty when the failure was produced by a boolean-only check.
    std::vector<PathSegment> path;
    /// Number of property/index steps to the failure; always set.
    std::size_t depth = 0;
    std::string expected;
    std::string actual;
    /// Property name for kMissingProperty and kSuperfluousProperty.
    std::string key;
    /// Closest union member for kNoUnionMemberMatched.
    std::size_t branch = 0;
    std::shared_ptr<const Failure> cause;

    /// Depth of the innermost cause; ranks union branch failures.
    [[nodiscard]] std::size_t specificity() const noexcept;

    /// The innermost cause, or this failure when there is none.
    [[nodiscard]] const Failure& innermost() const noexcept;
};

/// Verdict of one validation: empty means Pass.
using Verdict = std::optional<Failure>;

[[nodiscard]] std::string_view to_string(FailureKind kind) noexcept;

/**
 * Render a path such as `$.items[2].name` or `$["a key"]`.
 * @param path Structured path; branch segments are skipped
 * @param root Label of the validated value
 */
[[nodiscard]] std::string render_path(std::span<const PathSegment> path,
                                      std::string_view root = "$");

/// Reason text, e.g. `expected string, got number`.
[[nodiscard]] std::string render_reason(const Failure& failure, std::string_view root = "$");

/// Full message: `validation failed at $.a: expected string, got number`.
[[nodiscard]] std::string render_failure(const Failure& failure, std::string_view root = "$");

}  // namespace typeguard
