/**
 * @file config.cpp
 * @brief Scan settings from CLI flags and environment variables
 */

#include "wormscan/config.hpp"

#include "wormscan/feed.hpp"

#include <charconv>
#include <cstdlib>
#include <ranges>
#include <system_error>

namespace wormscan::config {

namespace {

[[nodiscard]] std::string_view trim(std::string_view input)
{
    const auto first = input.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = input.find_last_not_of(" \t\r\n");
    return input.substr(first, last - first + 1);
}

[[nodiscard]] std::optional<std::uint64_t> parse_unsigned(std::string_view value)
{
    if (value.empty()) {
        return std::nullopt;
    }
    std::uint64_t parsed = 0;
    const char* begin = value.data();
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return parsed;
}

// CLI parsing signature is stable.
// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
[[nodiscard]] auto read_option_value(std::span<char*> args,
                                     std::size_t index,
                                     std::string_view option) -> wormscan::Result<std::string>
{
    const std::size_t value_index = index + 1;
    if (value_index >= args.size() || args[value_index] == nullptr) {
        return std::unexpected(
            wormscan::Error::make("MissingArgument",
                                  std::string("Missing value for option: ") + std::string(option)));
    }
    return std::string(args[value_index]);
}

[[nodiscard]] wormscan::Result<report::ReportFormat> parse_format(std::string_view value)
{
    if (value == "text") {
        return report::ReportFormat::kText;
    }
    if (value == "json") {
        return report::ReportFormat::kJson;
    }
    return std::unexpected(wormscan::Error::make(
        "InvalidArgument",
        std::string("Invalid --format value (expected text or json): ") + std::string(value)));
}

[[nodiscard]] auto set_value_option(std::string_view arg, std::string value, ScanConfig& config)
    -> wormscan::Result<bool>
{
    if (arg == "--data-url") {
        config.data_url = std::move(value);
        return true;
    }
    if (arg == "--npm-ls-json") {
        config.npm_ls_json = std::move(value);
        return true;
    }
    if (arg == "--patch-distance") {
        config.patch_distance = parse_patch_distance(value);
        return true;
    }
    if (arg == "--ecosystem") {
        config.ecosystem = std::move(value);
        return true;
    }
    if (arg == "--format") {
        auto parsed = parse_format(value);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        config.format = *parsed;
        return true;
    }
    if (arg == "--out" || arg == "-o") {
        config.output = std::move(value);
        return true;
    }
    if (arg == "--schema-dir") {
        config.schema_dir = std::move(value);
        return true;
    }
    return false;
}

[[nodiscard]] bool is_value_option(std::string_view arg)
{
    return arg == "--data-url" || arg == "--npm-ls-json" || arg == "--patch-distance"
           || arg == "--ecosystem" || arg == "--format" || arg == "--out" || arg == "-o"
           || arg == "--schema-dir";
}

}  // namespace

EnvLookup process_env()
{
    return [](std::string_view name) -> std::optional<std::string> {
        const std::string key(name);
        const char* value = std::getenv(key.c_str());  // NOLINT(concurrency-mt-unsafe)
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

std::uint64_t parse_patch_distance(std::optional<std::string_view> value)
{
    if (!value) {
        return kDefaultPatchDistance;
    }
    return parse_unsigned(trim(*value)).value_or(kDefaultPatchDistance);
}

ScanConfig config_from_env(const EnvLookup& env)
{
    ScanConfig config;
    config.data_url = feed::kDefaultDataUrl;
    if (auto url = env(kEnvDataUrl); url && !url->empty()) {
        config.data_url = *url;
    }
    if (auto tree = env(kEnvNpmLsJson); tree && !tree->empty()) {
        config.npm_ls_json = *tree;
    }
    const auto distance = env(kEnvPatchDistance);
    config.patch_distance =
        parse_patch_distance(distance ? std::optional<std::string_view>(*distance) : std::nullopt);
    if (auto no_color = env(kEnvNoColor); no_color && !no_color->empty()) {
        config.color = false;
    }
    return config;
}

wormscan::Result<ScanConfig> parse_args(std::span<char*> args, ScanConfig base)
{
    ScanConfig config = std::move(base);
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
            config.show_help = true;
            continue;
        }
        if (arg == "--version" || arg == "-v") {
            config.show_version = true;
            continue;
        }
        if (arg == "--verbose") {
            config.verbose = true;
            continue;
        }
        if (arg == "--no-color") {
            config.color = false;
            continue;
        }
        if (is_value_option(arg)) {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            auto applied = set_value_option(arg, std::move(*value), config);
            if (!applied) {
                return std::unexpected(applied.error());
            }
            skip_next = true;
            continue;
        }
        return std::unexpected(wormscan::Error::make(
            "UnknownOption", std::string("Unknown option: ") + std::string(arg)));
    }
    return config;
}

}  // namespace wormscan::config
