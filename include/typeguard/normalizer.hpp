#pragma once

/**
 * @file normalizer.hpp
 * @brief Definition registry and descriptor normalization
 *
 * Normalization produces a closed descriptor graph: generic instantiations
 * are substituted, non-recursive references are inlined, recursive
 * definitions are kept once under a stable identifier and referenced by it,
 * and structurally identical subtrees share one node.
 */

#include "typeguard/common.hpp"
#include "typeguard/descriptor.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace typeguard {

/// Hard bound on nested generic instantiations during one normalization.
constexpr std::size_t kMaxInstantiationDepth = 64;

struct Definition
{
    std::vector<std::string> parameters;  ///< Empty for non-generic definitions
    DescriptorPtr body;
};

/**
 * @brief Named type definitions forming one resolution scope
 */
class TypeRegistry
{
public:
    /**
     * Register a non-generic definition
     * @return MalformedDescriptor on empty or duplicate names and null bodies
     */
    [[nodiscard]] typeguard::VoidResult define(std::string name, DescriptorPtr body);

    /**
     * Register a generic definition
     * @return MalformedDescriptor also on duplicate parameter names
     */
    [[nodiscard]] typeguard::VoidResult
    define_generic(std::string name, std::vector<std::string> parameters, DescriptorPtr body);

    [[nodiscard]] const Definition* find(std::string_view name) const;

    [[nodiscard]] const std::map<std::string, Definition, std::less<>>& definitions() const noexcept
    {
        return m_definitions;
    }

    [[nodiscard]] std::size_t size() const noexcept { return m_definitions.size(); }

private:
    std::map<std::string, Definition, std::less<>> m_definitions;
};

/**
 * @brief A closed, deduplicated descriptor graph ready for compilation
 *
 * Every ReferenceType in root or in a definition body names an entry of
 * definitions. No TypeParameterType or GenericInstantiationType remains.
 */
struct NormalizedType
{
    DescriptorPtr root;
    std::map<std::string, DescriptorPtr> definitions;  ///< Recursive definitions by id
    std::string fingerprint;  ///< Hash over root and definitions; the cache key
};

class Normalizer
{
public:
    explicit Normalizer(const TypeRegistry& registry);

    /**
     * Normalize a descriptor against the registry.
     *
     * Errors: UnresolvedReference, UnboundTypeParameter,
     * CyclicWithoutReference, InstantiationTooDeep, MalformedDescriptor
     * (null children, wrong number of type arguments).
     */
    [[nodiscard]] typeguard::Result<NormalizedType> run(const DescriptorPtr& root);

private:
    using Environment = std::map<std::string, DescriptorPtr, std::less<>>;

    enum class State { kInProgress, kDone };

    struct Entry
    {
        std::string id;
        State state = State::kInProgress;
        bool recursive = false;
        std::size_t descent = 0;  ///< Structural depth when resolution started
        DescriptorPtr body;
    };

    [[nodiscard]] typeguard::Result<DescriptorPtr> visit(const DescriptorPtr& node,
                                                         const Environment& env);
    [[nodiscard]] typeguard::Result<DescriptorPtr> visit_child(const DescriptorPtr& node,
                                                               const Environment& env);
    [[nodiscard]] typeguard::Result<DescriptorPtr>
    resolve(const std::string& name, const std::vector<DescriptorPtr>& arguments);

    /// Replace bound parameters without resolving anything; the result is parameter-free.
    [[nodiscard]] static typeguard::Result<DescriptorPtr> substitute(const DescriptorPtr& node,
                                                                     const Environment& env);

    /// Reject a memoized body that reaches an in-progress entry without a structural step.
    [[nodiscard]] typeguard::VoidResult check_guarded(const DescriptorPtr& node) const;
    [[nodiscard]] typeguard::Result<DescriptorPtr> visit_union(const UnionType& node,
                                                               const Environment& env);
    [[nodiscard]] typeguard::Result<DescriptorPtr>
    visit_intersection(const IntersectionType& node, const Environment& env);

    [[nodiscard]] std::string make_id(const std::string& name,
                                      const std::vector<DescriptorPtr>& arguments);
    [[nodiscard]] DescriptorPtr intern(DescriptorPtr node);

    const TypeRegistry& m_registry;
    std::map<std::string, Entry> m_entries;  ///< Keyed by name and argument fingerprints
    std::map<std::string, Entry*, std::less<>> m_by_id;
    std::set<std::string> m_ids;
    std::map<std::string, DescriptorPtr> m_definitions;
    std::unordered_map<std::string, std::vector<DescriptorPtr>> m_interned;
    std::size_t m_descent = 0;
    std::size_t m_instantiations = 0;
};

/// Normalize a descriptor; an empty registry suits self-contained descriptors.
[[nodiscard]] typeguard::Result<NormalizedType> normalize(const DescriptorPtr& root,
                                                          const TypeRegistry& registry = {});

}  // namespace typeguard
