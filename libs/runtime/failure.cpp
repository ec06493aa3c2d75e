/**
 * @file failure.cpp
 * @brief Failure path tracking and human-readable rendering
 */

#include "typeguard/failure.hpp"

#include <cctype>
#include <format>

#include <nlohmann/json.hpp>

namespace typeguard {

namespace {

[[nodiscard]] bool is_identifier(std::string_view key)
{
    if (key.empty()) {
        return false;
    }
    const auto is_start = [](unsigned char c) {
        return std::isalpha(c) != 0 || c == '_' || c == '$';
    };
    if (!is_start(static_cast<unsigned char>(key.front()))) {
        return false;
    }
    for (char c : key.substr(1)) {
        const auto uc = static_cast<unsigned char>(c);
        if (!is_start(uc) && std::isdigit(uc) == 0) {
            return false;
        }
    }
    return true;
}

[[nodiscard]] std::string quote(std::string_view text)
{
    return nlohmann::json(std::string(text))
        .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace

PathSegment PathSegment::property(std::string key)
{
    return PathSegment{.kind = Kind::kProperty, .key = std::move(key), .index = 0};
}

PathSegment PathSegment::element(std::size_t index)
{
    return PathSegment{.kind = Kind::kIndex, .key = {}, .index = index};
}

PathSegment PathSegment::branch(std::size_t index)
{
    return PathSegment{.kind = Kind::kBranch, .key = {}, .index = index};
}

std::size_t Failure::specificity() const noexcept
{
    return innermost().depth;
}

const Failure& Failure::innermost() const noexcept
{
    const Failure* current = this;
    while (current->cause) {
        current = current->cause.get();
    }
    return *current;
}

std::string_view to_string(FailureKind kind) noexcept
{
    switch (kind) {
        case FailureKind::kTypeMismatch:
            return "TypeMismatch";
        case FailureKind::kMissingProperty:
            return "MissingProperty";
        case FailureKind::kSuperfluousProperty:
            return "SuperfluousProperty";
        case FailureKind::kArityMismatch:
            return "ArityMismatch";
        case FailureKind::kNoUnionMemberMatched:
            return "NoUnionMemberMatched";
        case FailureKind::kUnreachable:
            return "Unreachable";
    }
    return "Unknown";
}

std::string render_path(std::span<const PathSegment> path, std::string_view root)
{
    std::string result(root);
    for (const auto& segment : path) {
        switch (segment.kind) {
            case PathSegment::Kind::kProperty:
                if (is_identifier(segment.key)) {
                    result += "." + segment.key;
                } else {
                    result += "[" + quote(segment.key) + "]";
                }
                break;
            case PathSegment::Kind::kIndex:
                result += std::format("[{}]", segment.index);
                break;
            case PathSegment::Kind::kBranch:
                break;
        }
    }
    return result;
}

std::string render_reason(const Failure& failure, std::string_view root)
{
    switch (failure.kind) {
        case FailureKind::kTypeMismatch:
            return std::format("expected {}, got {}", failure.expected, failure.actual);
        case FailureKind::kMissingProperty:
            return std::format("missing required property {}", quote(failure.key));
        case FailureKind::kSuperfluousProperty:
            return std::format("superfluous property {}", quote(failure.key));
        case FailureKind::kArityMismatch:
            return std::format("expected {}, got {}", failure.expected, failure.actual);
        case FailureKind::kNoUnionMemberMatched:
            if (failure.cause) {
                return std::format("no union member matched (closest member {} failed at {}: {})",
                                   failure.branch,
                                   render_path(failure.cause->path, root),
                                   render_reason(*failure.cause, root));
            }
            return "no union member matched";
        case FailureKind::kUnreachable:
            return std::format("expected never, got {}", failure.actual);
    }
    return "validation failed";
}

std::string render_failure(const Failure& failure, std::string_view root)
{
    if (failure.path.empty() && failure.depth > 0) {
        return std::format("validation failed: {}", render_reason(failure, root));
    }
    return std::format("validation failed at {}: {}",
                       render_path(failure.path, root),
                       render_reason(failure, root));
}

}  // namespace typeguard
