/**
 * @file value.cpp
 * @brief Runtime kinds of untyped values
 */

#include "typeguard/value.hpp"

#include <charconv>
#include <cmath>
#include <system_error>

namespace typeguard {

bool is_bigint(const nlohmann::json& value) noexcept
{
    if (!value.is_binary()) {
        return false;
    }
    const auto& binary = value.get_binary();
    if (!binary.has_subtype()) {
        return false;
    }
    return binary.subtype() == kBigIntPositiveSubtype || binary.subtype() == kBigIntNegativeSubtype;
}

ValueKind value_kind(const nlohmann::json& value) noexcept
{
    switch (value.type()) {
        case nlohmann::json::value_t::discarded:
            return ValueKind::kUndefined;
        case nlohmann::json::value_t::null:
            return ValueKind::kNull;
        case nlohmann::json::value_t::boolean:
            return ValueKind::kBoolean;
        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned:
        case nlohmann::json::value_t::number_float:
            return ValueKind::kNumber;
        case nlohmann::json::value_t::string:
            return ValueKind::kString;
        case nlohmann::json::value_t::binary:
            return is_bigint(value) ? ValueKind::kBigInt : ValueKind::kBinary;
        case nlohmann::json::value_t::array:
            return ValueKind::kArray;
        case nlohmann::json::value_t::object:
            return ValueKind::kObject;
    }
    return ValueKind::kUndefined;
}

std::string_view to_string(ValueKind kind) noexcept
{
    switch (kind) {
        case ValueKind::kUndefined:
            return "undefined";
        case ValueKind::kNull:
            return "null";
        case ValueKind::kBoolean:
            return "boolean";
        case ValueKind::kNumber:
            return "number";
        case ValueKind::kString:
            return "string";
        case ValueKind::kBigInt:
            return "bigint";
        case ValueKind::kBinary:
            return "binary";
        case ValueKind::kArray:
            return "array";
        case ValueKind::kObject:
            return "object";
    }
    return "unknown";
}

const nlohmann::json& undefined_value() noexcept
{
    static const nlohmann::json kUndefined(nlohmann::json::value_t::discarded);
    return kUndefined;
}

nlohmann::json make_bigint(std::vector<std::uint8_t> magnitude, bool negative)
{
    return nlohmann::json::binary(std::move(magnitude),
                                  negative ? kBigIntNegativeSubtype : kBigIntPositiveSubtype);
}

bool is_numeric_key(std::string_view key) noexcept
{
    if (key.empty()) {
        return false;
    }
    double parsed = 0.0;
    const char* begin = key.data();
    const char* end = key.data() + key.size();
    auto [ptr, ec] = std::from_chars(begin, end, parsed);
    return ec == std::errc{} && ptr == end && std::isfinite(parsed);
}

}  // namespace typeguard
