/**
 * @file canonical_json.cpp
 * @brief Canonical JSON serialization
 */

#include "typeguard/canonical_json.hpp"

#include "typeguard/common.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <format>
#include <limits>
#include <ranges>
#include <vector>

namespace typeguard::canonical {

namespace {

typeguard::VoidResult validate_finite(const nlohmann::json& j, std::string_view path)
{
    if (j.is_number_float() && !std::isfinite(j.get<double>())) {
        return std::unexpected(
            Error::make(errc::kNonFiniteNumber,
                        std::format("Non-finite numbers not allowed in canonical JSON at: {}",
                                    path)));
    }
    if (j.is_object()) {
        for (const auto& [key, val] : j.items()) {
            std::string next_path = std::string(path) + "." + key;
            if (auto result = validate_finite(val, next_path); !result) {
                return result;
            }
        }
    } else if (j.is_array()) {
        for (auto [i, elem] : std::views::enumerate(j)) {
            if (auto result = validate_finite(elem, std::format("{}[{}]", path, i)); !result) {
                return result;
            }
        }
    }
    return {};
}

[[nodiscard]] bool is_integral_double(double value)
{
    constexpr double kLimit = 9007199254740992.0;  // 2^53
    return std::isfinite(value) && std::trunc(value) == value && std::fabs(value) <= kLimit;
}

/**
 * @brief Recursively create a sorted copy of JSON (keys in lexicographic order)
 */
[[nodiscard]] nlohmann::json make_sorted_copy(const nlohmann::json& j)
{
    if (j.is_object()) {
        std::vector<std::string> keys;
        keys.reserve(j.size());
        for (const auto& [key, _] : j.items()) {
            keys.push_back(key);
        }
        std::ranges::sort(keys);

        nlohmann::json result = nlohmann::json::object();
        for (const auto& key : keys) {
            result[key] = make_sorted_copy(j.at(key));
        }
        return result;
    }
    if (j.is_array()) {
        nlohmann::json result = nlohmann::json::array();
        result.get_ref<nlohmann::json::array_t&>().reserve(j.size());
        for (const auto& elem : j) {
            result.push_back(make_sorted_copy(elem));
        }
        return result;
    }
    return canonical_numbers(j);
}

}  // namespace

nlohmann::json canonical_numbers(const nlohmann::json& j)
{
    if (j.is_number_float()) {
        const double value = j.get<double>();
        if (is_integral_double(value)) {
            return nlohmann::json(static_cast<std::int64_t>(value));
        }
        return j;
    }
    if (j.is_number_unsigned()) {
        const auto value = j.get<std::uint64_t>();
        if (value <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return nlohmann::json(static_cast<std::int64_t>(value));
        }
        return j;
    }
    if (j.is_array()) {
        nlohmann::json result = nlohmann::json::array();
        for (const auto& elem : j) {
            result.push_back(canonical_numbers(elem));
        }
        return result;
    }
    if (j.is_object()) {
        nlohmann::json result = nlohmann::json::object();
        for (const auto& [key, val] : j.items()) {
            result[key] = canonical_numbers(val);
        }
        return result;
    }
    return j;
}

typeguard::Result<std::string> canonicalize(const nlohmann::json& j)
{
    if (auto result = validate_finite(j, "$"); !result) {
        return std::unexpected(result.error());
    }

    nlohmann::json sorted = make_sorted_copy(j);

    try {
        return sorted.dump(-1, ' ', false, nlohmann::json::error_handler_t::strict);
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(Error::make(
            errc::kParseError, std::string("Failed to serialize canonical JSON: ") + ex.what()));
    }
}

typeguard::Result<std::string> hash_canonical(const nlohmann::json& j)
{
    auto canonical = canonicalize(j);
    if (!canonical) {
        return std::unexpected(canonical.error());
    }
    return common::sha256_prefixed(*canonical);
}

typeguard::VoidResult validate_for_canonical(const nlohmann::json& j)
{
    return validate_finite(j, "$");
}

}  // namespace typeguard::canonical
