/**
 * @file context.cpp
 * @brief Validation context bookkeeping
 */

#include "typeguard/context.hpp"

#include <algorithm>

namespace typeguard {

// ============================================================================
// RecursionGuard
// ============================================================================

bool RecursionGuard::enter(std::size_t slot, const void* value)
{
    return m_active.emplace(slot, value).second;
}

void RecursionGuard::leave(std::size_t slot, const void* value)
{
    m_active.erase({slot, value});
}

bool RecursionGuard::active(std::size_t slot, const void* value) const
{
    return m_active.contains({slot, value});
}

RecursionGuard::Scope::Scope(RecursionGuard& guard, std::size_t slot, const void* value)
    : m_guard(guard)
    , m_slot(slot)
    , m_value(value)
    , m_entered(guard.enter(slot, value))
{}

RecursionGuard::Scope::~Scope()
{
    if (m_entered) {
        m_guard.leave(m_slot, m_value);
    }
}

// ============================================================================
// ValidationContext
// ============================================================================

ValidationContext::ValidationContext(ValidationOptions options)
    : m_options(options)
{}

ValidationContext::PathScope::PathScope(ValidationContext& context, PathSegment segment)
    : m_context(context)
    , m_counted(segment.kind != PathSegment::Kind::kBranch)
{
    if (m_counted) {
        ++m_context.m_depth;
    }
    if (m_context.mode() != ValidationMode::kBoolean) {
        m_context.m_path.push_back(std::move(segment));
    }
}

ValidationContext::PathScope::~PathScope()
{
    if (m_counted) {
        --m_context.m_depth;
    }
    if (m_context.mode() != ValidationMode::kBoolean) {
        m_context.m_path.pop_back();
    }
}

ValidationContext::PathScope ValidationContext::at_property(std::string_view key)
{
    if (mode() == ValidationMode::kBoolean) {
        return PathScope(*this, PathSegment{});
    }
    return PathScope(*this, PathSegment::property(std::string(key)));
}

ValidationContext::PathScope ValidationContext::at_index(std::size_t index)
{
    return PathScope(*this, PathSegment::element(index));
}

ValidationContext::PathScope ValidationContext::at_branch(std::size_t index)
{
    return PathScope(*this, PathSegment::branch(index));
}

Failure ValidationContext::make_failure(FailureKind kind,
                                        std::string_view expected,
                                        std::string_view actual,
                                        std::string_view key) const
{
    Failure failure;
    failure.kind = kind;
    failure.path = m_path;
    failure.depth = m_depth;
    failure.expected = std::string(expected);
    failure.actual = std::string(actual);
    failure.key = std::string(key);
    return failure;
}

Verdict ValidationContext::report(Failure failure)
{
    if (diagnostic() && m_suppressed == 0) {
        m_diagnostics.push_back(failure);
    }
    return failure;
}

ValidationContext::SuppressRecording::SuppressRecording(ValidationContext& context)
    : m_context(context)
{
    ++m_context.m_suppressed;
}

ValidationContext::SuppressRecording::~SuppressRecording()
{
    --m_context.m_suppressed;
}

ValidationContext::AllowanceScope::AllowanceScope(ValidationContext& context,
                                                  const nlohmann::json* value,
                                                  const std::set<std::string, std::less<>>* keys)
    : m_context(context)
{
    m_context.m_allowances.emplace_back(value, keys);
}

ValidationContext::AllowanceScope::~AllowanceScope()
{
    m_context.m_allowances.pop_back();
}

bool ValidationContext::is_allowed(const nlohmann::json* value, std::string_view key) const
{
    return std::ranges::any_of(m_allowances, [value, key](const auto& allowance) {
        return allowance.first == value && allowance.second->contains(key);
    });
}

}  // namespace typeguard
