/**
 * @file config.cpp
 * @brief Process-wide settings, message hook and configuration files
 */

#include "typeguard/config.hpp"

#include "typeguard/json_io.hpp"
#include "typeguard/schema_validate.hpp"
#include "typeguard/version.hpp"

#include <filesystem>
#include <format>
#include <mutex>

namespace typeguard::config {

namespace {

struct GlobalState
{
    std::mutex mutex;
    Settings settings;
    MessageHook hook;
};

[[nodiscard]] GlobalState& state()
{
    static GlobalState instance;
    return instance;
}

[[nodiscard]] Error invalid(std::string message)
{
    return Error::make(errc::kInvalidConfig, std::move(message));
}

[[nodiscard]] typeguard::VoidResult read_bool(const nlohmann::json& document,
                                              const char* key,
                                              bool& out)
{
    if (!document.contains(key)) {
        return {};
    }
    const auto& value = document.at(key);
    if (!value.is_boolean()) {
        return std::unexpected(invalid(std::format("\"{}\" must be a boolean", key)));
    }
    out = value.get<bool>();
    return {};
}

}  // namespace

Settings current()
{
    auto& global = state();
    std::lock_guard lock(global.mutex);
    return global.settings;
}

void apply(Settings settings)
{
    auto& global = state();
    std::lock_guard lock(global.mutex);
    global.settings = std::move(settings);
}

void set_default_message_hook(MessageHook hook)
{
    auto& global = state();
    std::lock_guard lock(global.mutex);
    global.hook = std::move(hook);
}

std::optional<std::string> render_message(const Failure& failure)
{
    Settings settings;
    MessageHook hook;
    {
        auto& global = state();
        std::lock_guard lock(global.mutex);
        settings = global.settings;
        hook = global.hook;
    }
    if (!settings.compute_messages) {
        return std::nullopt;
    }
    // The hook runs outside the lock so it may read settings itself.
    if (hook) {
        return hook(failure);
    }
    return render_failure(failure, settings.root_name);
}

std::string_view to_string(OpaqueTypePolicy policy) noexcept
{
    switch (policy) {
        case OpaqueTypePolicy::kReject:
            return "reject";
        case OpaqueTypePolicy::kAllow:
            return "allow";
    }
    return "reject";
}

std::optional<OpaqueTypePolicy> opaque_policy_from_string(std::string_view name)
{
    if (name == "reject") {
        return OpaqueTypePolicy::kReject;
    }
    if (name == "allow") {
        return OpaqueTypePolicy::kAllow;
    }
    return std::nullopt;
}

typeguard::Result<Settings> settings_from_json(const nlohmann::json& document)
{
    if (!document.is_object()) {
        return std::unexpected(invalid("configuration must be a JSON object"));
    }
    if (document.contains("schema_version")
        && document.at("schema_version") != nlohmann::json(kConfigSchemaVersion)) {
        return std::unexpected(invalid(std::format("unsupported schema_version {}, expected {}",
                                                   document.at("schema_version").dump(),
                                                   kConfigSchemaVersion)));
    }

    Settings settings;
    if (auto result = read_bool(document, "short_circuit", settings.short_circuit); !result) {
        return std::unexpected(result.error());
    }
    if (auto result = read_bool(document, "compute_messages", settings.compute_messages);
        !result) {
        return std::unexpected(result.error());
    }
    if (document.contains("root_name")) {
        const auto& root_name = document.at("root_name");
        if (!root_name.is_string() || root_name.get<std::string>().empty()) {
            return std::unexpected(invalid("\"root_name\" must be a non-empty string"));
        }
        settings.root_name = root_name.get<std::string>();
    }
    if (document.contains("opaque_types")) {
        const auto& policy = document.at("opaque_types");
        std::optional<OpaqueTypePolicy> parsed;
        if (policy.is_string()) {
            parsed = opaque_policy_from_string(policy.get<std::string>());
        }
        if (!parsed) {
            return std::unexpected(
                invalid(std::format("\"opaque_types\" must be \"reject\" or \"allow\", got {}",
                                    policy.dump())));
        }
        settings.opaque_types = *parsed;
    }
    return settings;
}

typeguard::Result<Settings> load_settings(const std::string& path, const std::string& schema_dir)
{
    auto document = common::read_json_file(path);
    if (!document) {
        return std::unexpected(document.error());
    }
    const auto schema_path = (std::filesystem::path(schema_dir) / "config.v1.schema.json").string();
    if (auto valid = common::validate_json(*document, schema_path); !valid) {
        return std::unexpected(Error::make(errc::kSchemaInvalid,
                                           "Config schema invalid: " + valid.error().message));
    }
    return settings_from_json(*document);
}

}  // namespace typeguard::config
