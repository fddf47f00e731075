#pragma once

/**
 * @file config.hpp
 * @brief Scan settings from CLI flags and environment variables
 *
 * Precedence: flags, then environment, then defaults.
 */

#include "wormscan/common.hpp"
#include "wormscan/report.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace wormscan::config {

/// Environment variable names
constexpr std::string_view kEnvDataUrl = "WORMSCAN_DATA_URL";
constexpr std::string_view kEnvNpmLsJson = "WORMSCAN_NPM_LS_JSON";
constexpr std::string_view kEnvPatchDistance = "WORMSCAN_PATCH_DISTANCE";
constexpr std::string_view kEnvNoColor = "NO_COLOR";

constexpr std::uint64_t kDefaultPatchDistance = 1;

struct ScanConfig
{
    std::string data_url;
    std::optional<std::string> npm_ls_json;
    std::uint64_t patch_distance = kDefaultPatchDistance;
    std::string ecosystem = "npm";
    report::ReportFormat format = report::ReportFormat::kText;
    std::optional<std::string> output;
    std::string schema_dir = "schemas";
    bool color = true;
    bool verbose = false;
    bool show_help = false;
    bool show_version = false;
};

/// Returns the variable's value, or std::nullopt when unset
using EnvLookup = std::function<std::optional<std::string>(std::string_view)>;

/**
 * Lookup backed by the process environment
 */
[[nodiscard]] EnvLookup process_env();

/**
 * Lenient patch distance: surrounding whitespace is ignored and anything
 * other than a non-negative integer gives kDefaultPatchDistance.
 */
[[nodiscard]] std::uint64_t parse_patch_distance(std::optional<std::string_view> value);

/**
 * Defaults overlaid with environment variables.
 */
[[nodiscard]] ScanConfig config_from_env(const EnvLookup& env);

/**
 * Overlay command line options onto a base configuration.
 *
 * @param args Arguments after the program name
 * @param base Configuration from config_from_env()
 * @return Updated configuration, or MissingArgument / InvalidArgument /
 *         UnknownOption
 */
[[nodiscard]] wormscan::Result<ScanConfig> parse_args(std::span<char*> args, ScanConfig base);

}  // namespace wormscan::config
