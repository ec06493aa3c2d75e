/**
 * @file main.cpp
 * @brief typeguard CLI entry point
 *
 * Commands:
 *   check     - Validate a JSON value against a descriptor document
 *   normalize - Print the normalized form of a descriptor document
 *   version   - Show version information
 */

#include "typeguard/common.hpp"
#include "typeguard/require_cpp23.hpp"
#include "typeguard/config.hpp"
#include "typeguard/descriptor_json.hpp"
#include "typeguard/json_io.hpp"
#include "typeguard/normalizer.hpp"
#include "typeguard/typeguard.hpp"
#include "typeguard/version.hpp"

#include <exception>
#include <optional>
#include <print>
#include <ranges>
#include <span>
#include <string>
#include <string_view>

namespace {

constexpr int kExitMismatch = 2;

void print_version()
{
    std::println("typeguard {} ({})", typeguard::kVersion, typeguard::kBuildId);
    std::println("  descriptor: {}", typeguard::kDescriptorSchemaVersion);
    std::println("  config:     {}", typeguard::kConfigSchemaVersion);
}

void print_help()
{
    std::print(R"(typeguard - Runtime structural type validation

Usage: typeguard <command> [options]

Commands:
  check       Validate a JSON value against a descriptor document
  normalize   Print the normalized type of a descriptor document
  version     Show version information

Global Options:
  --help, -h          Show this help message
  --version, -v       Show version information

Run 'typeguard <command> --help' for command-specific options.
)");
}

void print_check_help()
{
    std::print(R"(Usage: typeguard check --type FILE --value FILE [options]

Options:
  --type FILE         Descriptor document (typeguard.descriptor.v1)
  --value FILE        JSON value to validate
  --equals            Reject properties the type does not declare
  --diagnose          Report every failure instead of the first
  --config FILE       Configuration file (typeguard.config.v1)
  --schema-dir DIR    Path to schema directory (default: schemas)

Exit status: 0 when the value conforms, 2 when it does not, 1 on error.
)");
}

void print_normalize_help()
{
    std::print(R"(Usage: typeguard normalize --type FILE [options]

Options:
  --type FILE         Descriptor document (typeguard.descriptor.v1)
  --config FILE       Configuration file (typeguard.config.v1)
  --schema-dir DIR    Path to schema directory (default: schemas)
)");
}

struct CheckOptions
{
    std::string type_path;
    std::string value_path;
    std::optional<std::string> config_path;
    std::string schema_dir;
    bool equals;
    bool diagnose;
    bool show_help;
};

// CLI parsing signature is stable.
// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
[[nodiscard]] auto read_option_value(std::span<char*> args,
                                     std::size_t index,
                                     std::string_view option) -> typeguard::Result<std::string>
{
    const std::size_t value_index = index + 1;
    if (value_index >= args.size() || args[value_index] == nullptr) {
        return std::unexpected(typeguard::Error::make(
            typeguard::errc::kMissingArgument,
            std::string("Missing value for option: ") + std::string(option)));
    }
    return std::string(args[value_index]);
}

[[nodiscard]] typeguard::Result<CheckOptions> parse_check_args(std::span<char*> args,
                                                               bool allow_value_options)
{
    CheckOptions options{.type_path = std::string{},
                         .value_path = std::string{},
                         .config_path = std::nullopt,
                         .schema_dir = "schemas",
                         .equals = false,
                         .diagnose = false,
                         .show_help = false};
    bool skip_next = false;
    for (auto [i, arg_ptr] : std::views::enumerate(args)) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (arg_ptr == nullptr) {
            continue;
        }
        const auto idx = static_cast<std::size_t>(i);
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }

        std::string* target = nullptr;
        if (arg == "--type") {
            target = &options.type_path;
        } else if (arg == "--schema-dir") {
            target = &options.schema_dir;
        } else if (arg == "--value" && allow_value_options) {
            target = &options.value_path;
        }
        if (target != nullptr) {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            *target = *value;
            skip_next = true;
            continue;
        }
        if (arg == "--config") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            options.config_path = *value;
            skip_next = true;
            continue;
        }
        if (allow_value_options && arg == "--equals") {
            options.equals = true;
            continue;
        }
        if (allow_value_options && arg == "--diagnose") {
            options.diagnose = true;
            continue;
        }
        return std::unexpected(typeguard::Error::make(
            typeguard::errc::kInvalidArgument, std::string("Unknown option: ") + std::string(arg)));
    }
    return options;
}

/// Apply the configuration file, if any, and load the descriptor document.
[[nodiscard]] typeguard::Result<typeguard::NormalizedType> load_type(const CheckOptions& options)
{
    if (options.config_path) {
        auto settings = typeguard::config::load_settings(*options.config_path, options.schema_dir);
        if (!settings) {
            return std::unexpected(settings.error());
        }
        typeguard::config::apply(std::move(*settings));
    }
    auto document = typeguard::load_type_document_file(
        options.type_path, options.schema_dir, typeguard::config::current().opaque_types);
    if (!document) {
        return std::unexpected(document.error());
    }
    return typeguard::normalize(document->root, document->registry);
}

int run_check(const CheckOptions& options)
{
    auto type = load_type(options);
    if (!type) {
        std::println(stderr, "Error: {}: {}", type.error().code, type.error().message);
        return 1;
    }
    auto value = typeguard::common::read_json_file(options.value_path);
    if (!value) {
        std::println(stderr, "Error: {}: {}", value.error().code, value.error().message);
        return 1;
    }
    auto guard = typeguard::TypeGuard::create(*type);
    if (!guard) {
        std::println(stderr, "Error: {}: {}", guard.error().code, guard.error().message);
        return 1;
    }

    const std::string root_name = typeguard::config::current().root_name;
    if (options.diagnose) {
        const auto failures = guard->diagnose(*value, options.equals);
        if (failures.empty()) {
            std::println("[check] OK");
            return 0;
        }
        for (const auto& failure : failures) {
            std::println("{}", typeguard::render_failure(failure, root_name));
        }
        std::println("[check] {} failure(s)", failures.size());
        return kExitMismatch;
    }

    const auto verdict = guard->check(*value, options.equals);
    if (!verdict) {
        std::println("[check] OK");
        return 0;
    }
    std::println("{}", typeguard::config::render_message(*verdict).value_or("validation failed"));
    return kExitMismatch;
}

int run_normalize(const CheckOptions& options)
{
    auto type = load_type(options);
    if (!type) {
        std::println(stderr, "Error: {}: {}", type.error().code, type.error().message);
        return 1;
    }
    std::println("{}", typeguard::normalized_to_json(*type).dump(2));
    return 0;
}

int cmd_check(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_check_args(args, true);
    if (!options) {
        std::println(stderr, "Error: {}: {}", options.error().code, options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_check_help();
        return 0;
    }
    if (options->type_path.empty() || options->value_path.empty()) {
        std::println(stderr, "Error: --type and --value are required");
        print_check_help();
        return 1;
    }
    return run_check(*options);
}

int cmd_normalize(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_check_args(args, false);
    if (!options) {
        std::println(stderr, "Error: {}: {}", options.error().code, options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_normalize_help();
        return 0;
    }
    if (options->type_path.empty()) {
        std::println(stderr, "Error: --type is required");
        print_normalize_help();
        return 1;
    }
    return run_normalize(*options);
}

[[nodiscard]] int run_cli(int argc, char** argv)
{
    try {
        if (argc < 2) {
            print_help();
            return 1;
        }

        std::string_view cmd = argv[1];

        if (cmd == "--help" || cmd == "-h") {
            print_help();
            return 0;
        }
        if (cmd == "--version" || cmd == "-v" || cmd == "version") {
            print_version();
            return 0;
        }

        int sub_argc = argc - 2;
        char** sub_argv = argv + 2;

        if (cmd == "check") {
            return cmd_check(sub_argc, sub_argv);
        }
        if (cmd == "normalize") {
            return cmd_normalize(sub_argc, sub_argv);
        }

        std::println(stderr, "Unknown command: {}", cmd);
        print_help();
        return 1;
    } catch (const std::exception& ex) {
        try {
            std::println(stderr, "Error: {}", ex.what());
        } catch (...) {
            std::terminate();
        }
        return 1;
    } catch (...) {
        try {
            std::println(stderr, "Error: unknown exception");
        } catch (...) {
            std::terminate();
        }
        return 1;
    }
}

}  // namespace

int main(int argc, char** argv)
{
    return run_cli(argc, argv);
}
