/**
 * @file main.cpp
 * @brief wormscan CLI entry point
 *
 * Audits the project's installed npm packages against a feed of known
 * malicious versions.
 *
 * Exit codes:
 *   0 - no critical findings (warnings allowed)
 *   1 - error (fetch, npm, parse, usage)
 *   2 - at least one critical finding
 */

#include "wormscan/advisory.hpp"
#include "wormscan/common.hpp"
#include "wormscan/config.hpp"
#include "wormscan/deptree.hpp"
#include "wormscan/feed.hpp"
#include "wormscan/matcher.hpp"
#include "wormscan/npm.hpp"
#include "wormscan/report.hpp"
#include "wormscan/version.hpp"

#include <exception>
#include <filesystem>
#include <format>
#include <future>
#include <print>
#include <span>
#include <string>
#include <string_view>

#include <unistd.h>

namespace {

void print_version()
{
    std::println("wormscan {} ({})", wormscan::kVersion, wormscan::kBuildId);
    std::println("  report schema: {}", wormscan::kReportSchemaVersion);
}

void print_help()
{
    std::print(R"(wormscan - audit installed npm packages against known malicious versions

Usage: wormscan [options]

Runs `npm ls --all --json` in the current directory and compares every
installed package with the malware feed.

Options:
  --data-url URL          Advisory feed (http(s)://, file:// or a path)
  --npm-ls-json FILE      Read the dependency tree from FILE instead of npm
  --patch-distance N      Warn when patch differs by at most N (default: 1)
  --ecosystem NAME        Keep feed records for this ecosystem (default: npm)
  --format text|json      Report format (default: text)
  --out, -o FILE          Write the report to FILE instead of stdout
  --schema-dir DIR        Directory with scan_report.v1.schema.json (default: schemas)
  --no-color              Disable ANSI colors
  --verbose               Print progress to stderr
  --help, -h              Show this help
  --version, -v           Show version

Environment:
  WORMSCAN_DATA_URL, WORMSCAN_NPM_LS_JSON, WORMSCAN_PATCH_DISTANCE, NO_COLOR

Exit codes:
  0  No critical findings
  1  Error
  2  Critical findings
)");
}

[[nodiscard]] wormscan::npm::TreeOptions tree_options(const wormscan::config::ScanConfig& config)
{
    wormscan::npm::TreeOptions options;
    if (config.npm_ls_json) {
        options.override_path = std::filesystem::path(*config.npm_ls_json);
    }
    return options;
}

[[nodiscard]] wormscan::report::ReportOptions report_options(
    const wormscan::config::ScanConfig& config)
{
    wormscan::report::ReportOptions options;
    options.format = config.format;
    if (config.output) {
        options.output_path = std::filesystem::path(*config.output);
    }
    options.schema_dir = config.schema_dir;
    options.color = config.color && config.format == wormscan::report::ReportFormat::kText
                    && !config.output && ::isatty(STDOUT_FILENO) == 1;
    options.patch_distance = config.patch_distance;
    options.ecosystem = config.ecosystem;
    return options;
}

[[nodiscard]] int run_scan(const wormscan::config::ScanConfig& config)
{
    const auto progress = [&config](std::string_view message) {
        if (config.verbose) {
            std::println(stderr, "[scan] {}", message);
        }
    };

    wormscan::feed::TransportSession session;
    if (!session.ok()) {
        std::println(stderr, "Error: Failed to initialize HTTP transport");
        return 1;
    }

    progress(std::format("fetching advisory feed: {}", config.data_url));
    auto feed_future = std::async(std::launch::async, [&config] {
        return wormscan::feed::fetch_advisory_feed(config.data_url);
    });
    progress(config.npm_ls_json
                 ? std::format("reading dependency tree: {}", *config.npm_ls_json)
                 : std::string("running npm ls --all --json"));
    auto tree_future = std::async(std::launch::async, [&config] {
        return wormscan::npm::read_dependency_tree(tree_options(config));
    });

    auto feed = feed_future.get();
    auto tree = tree_future.get();
    if (!feed) {
        std::println(stderr, "Error: {}", feed.error().message);
        return 1;
    }
    if (!tree) {
        std::println(stderr, "Error: {}", tree.error().message);
        return 1;
    }

    const auto advisories =
        wormscan::advisory::normalize(*feed, {.ecosystem = config.ecosystem});
    progress(std::format("advisory map: {} names, {} versions",
                         advisories.size(),
                         wormscan::advisory::fact_count(advisories)));

    const auto installed = wormscan::deptree::flatten_packages(*tree);
    progress(std::format("installed packages: {}", installed.size()));

    const auto findings = wormscan::matcher::match_packages(
        installed, advisories, {.patch_distance = config.patch_distance});
    progress(std::format("findings: {}", findings.size()));

    const auto options = report_options(config);
    const auto summary = wormscan::report::summarize(installed, advisories, findings);
    auto output = wormscan::report::build_report(findings, summary, options);
    if (!output) {
        std::println(stderr, "Error: {}", output.error().message);
        return 1;
    }
    if (auto written = wormscan::report::write_report(options, *output); !written) {
        std::println(stderr, "Error: {}", written.error().message);
        return 1;
    }
    if (options.output_path) {
        progress(std::format("report written: {}", options.output_path->string()));
    }
    return wormscan::report::exit_code_for(findings);
}

[[nodiscard]] int run_cli(int argc, char** argv)
{
    try {
        const auto env_config = wormscan::config::config_from_env(wormscan::config::process_env());
        std::span<char*> args(argv, static_cast<std::size_t>(argc));
        if (!args.empty()) {
            args = args.subspan(1);
        }
        auto config = wormscan::config::parse_args(args, env_config);
        if (!config) {
            std::println(stderr, "Error: {}", config.error().message);
            print_help();
            return 1;
        }
        if (config->show_help) {
            print_help();
            return 0;
        }
        if (config->show_version) {
            print_version();
            return 0;
        }
        return run_scan(*config);
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
