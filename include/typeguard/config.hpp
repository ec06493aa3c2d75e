#pragma once

/**
 * @file config.hpp
 * @brief Process-wide settings and the default message hook
 *
 * Settings are a single mutex-guarded global. Readers take a snapshot with
 * current(); apply() replaces the whole value. The executor reads settings
 * when an entry point is created and when a failure message is rendered.
 */

#include "typeguard/common.hpp"
#include "typeguard/failure.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace typeguard::config {

/// Handling of function and class types met at the extraction boundary.
enum class OpaqueTypePolicy {
    kReject,  ///< UnsupportedType error
    kAllow,   ///< Treated as any
};

struct Settings
{
    bool short_circuit = false;     ///< Entry points report Pass without validating
    bool compute_messages = true;   ///< Render failure messages for assertions
    std::string root_name = "$";    ///< Label of the value root in rendered paths
    OpaqueTypePolicy opaque_types = OpaqueTypePolicy::kReject;
};

/**
 * Custom message renderer. Returning std::nullopt suppresses the message.
 */
using MessageHook = std::function<std::optional<std::string>(const Failure&)>;

[[nodiscard]] Settings current();
void apply(Settings settings);

/// Install a message hook; an empty hook restores the built-in renderer.
void set_default_message_hook(MessageHook hook);

/**
 * Render a failure using the current hook and settings.
 * @return std::nullopt when messages are disabled or the hook suppresses them
 */
[[nodiscard]] std::optional<std::string> render_message(const Failure& failure);

[[nodiscard]] std::string_view to_string(OpaqueTypePolicy policy) noexcept;
[[nodiscard]] std::optional<OpaqueTypePolicy> opaque_policy_from_string(std::string_view name);

/**
 * Build settings from a configuration document; absent keys keep defaults.
 * @return InvalidConfig on wrong value types or unknown policies
 */
[[nodiscard]] typeguard::Result<Settings> settings_from_json(const nlohmann::json& document);

/**
 * Read, schema-validate and convert a configuration file.
 * @param schema_dir Directory holding config.v1.schema.json
 */
[[nodiscard]] typeguard::Result<Settings> load_settings(const std::string& path,
                                                        const std::string& schema_dir);

}  // namespace typeguard::config
