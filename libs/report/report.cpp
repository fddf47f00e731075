/**
 * @file report.cpp
 * @brief Scan statistics and text/JSON report rendering
 */

#include "wormscan/report.hpp"

#include "wormscan/schema_validate.hpp"
#include "wormscan/version.hpp"

#include <algorithm>
#include <cstdint>
#include <format>
#include <fstream>
#include <map>
#include <print>
#include <ranges>
#include <string_view>

namespace wormscan::report {

namespace {

enum class Style { kRed, kYellow, kGreen, kBold };

[[nodiscard]] std::string_view ansi_code(Style style) noexcept
{
    switch (style) {
        case Style::kRed:
            return "31";
        case Style::kYellow:
            return "33";
        case Style::kGreen:
            return "32";
        case Style::kBold:
            return "1";
    }
    return "0";
}

[[nodiscard]] std::string paint(std::string_view text, Style style, bool color)
{
    if (!color) {
        return std::string(text);
    }
    return std::format("\x1b[{}m{}\x1b[0m", ansi_code(style), text);
}

[[nodiscard]] std::string join(const std::vector<std::string>& items, std::string_view separator)
{
    std::string result;
    for (auto [i, item] : std::views::enumerate(items)) {
        if (i != 0) {
            result += separator;
        }
        result += item;
    }
    return result;
}

[[nodiscard]] std::string finding_line(const matcher::Finding& finding,
                                       const ReportOptions& options)
{
    if (finding.level == matcher::Level::kCritical) {
        return std::format("{}: {}@{} matches blocked {}",
                           paint("CRITICAL", Style::kRed, options.color),
                           finding.name,
                           finding.version,
                           finding.against);
    }
    return std::format("{}: {}@{} adjacent to blocked {} (patch distance {})",
                       paint("WARNING", Style::kYellow, options.color),
                       finding.name,
                       finding.version,
                       finding.against,
                       options.patch_distance);
}

[[nodiscard]] std::string present_line(const PresentPackage& present, bool color)
{
    std::string line = std::format("{} {} installed {}; affected: {}",
                                   paint("INFO", Style::kBold, color),
                                   present.name,
                                   join(present.installed, ", "),
                                   join(present.affected, ", "));
    if (present.affected_omitted > 0) {
        line += std::format(" (+{} more)", present.affected_omitted);
    }
    return line;
}

[[nodiscard]] wormscan::VoidResult write_lines(const std::filesystem::path& path,
                                               const std::vector<std::string>& lines)
{
    std::ofstream out(path);
    if (!out) {
        return std::unexpected(
            wormscan::Error::make("IOError", "Failed to open output file: " + path.string()));
    }
    for (const auto& line : lines) {
        out << line << "\n";
    }
    if (!out) {
        return std::unexpected(
            wormscan::Error::make("IOError", "Failed to write output file: " + path.string()));
    }
    return {};
}

/// Report documents hold strings and non-negative integer counts only
[[nodiscard]] wormscan::VoidResult check_report_value(const nlohmann::json& value,
                                                      const std::string& pointer)
{
    const auto where = [&pointer] { return pointer.empty() ? std::string("/") : pointer; };
    switch (value.type()) {
        case nlohmann::json::value_t::number_float:
            return std::unexpected(wormscan::Error::make(
                "NonIntegerValue", std::format("Report value at {} is not an integer", where())));
        case nlohmann::json::value_t::number_integer:
            if (value.get<std::int64_t>() < 0) {
                return std::unexpected(wormscan::Error::make(
                    "NegativeCount", std::format("Report value at {} is negative", where())));
            }
            break;
        case nlohmann::json::value_t::object:
            for (const auto& [key, child] : value.items()) {
                if (auto checked = check_report_value(child, pointer + "/" + key); !checked) {
                    return checked;
                }
            }
            break;
        case nlohmann::json::value_t::array:
            for (auto [i, child] : std::views::enumerate(value)) {
                if (auto checked = check_report_value(child, std::format("{}/{}", pointer, i));
                    !checked) {
                    return checked;
                }
            }
            break;
        default:
            break;
    }
    return {};
}

}  // namespace

wormscan::Result<std::string> serialize_report(const nlohmann::json& document)
{
    if (auto checked = check_report_value(document, {}); !checked) {
        return std::unexpected(checked.error());
    }
    // nlohmann::json objects are std::map backed: keys already dump in byte order
    try {
        return document.dump(-1, ' ', false, nlohmann::json::error_handler_t::strict);
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(wormscan::Error::make(
            "InvalidUtf8", std::string("Report contains invalid UTF-8: ") + ex.what()));
    }
}

ScanSummary summarize(const std::vector<deptree::InstalledPackage>& installed,
                      const advisory::AdvisoryMap& advisories,
                      const std::vector<matcher::Finding>& findings)
{
    ScanSummary summary;
    summary.installed_count = installed.size();
    summary.advisory_name_count = advisories.size();

    // installed is sorted by name then version, so versions arrive in order
    std::map<std::string, std::vector<std::string>> versions_by_name;
    for (const auto& package : installed) {
        versions_by_name[package.name].push_back(package.version);
    }
    summary.name_count = versions_by_name.size();

    for (auto& [name, versions] : versions_by_name) {
        const auto it = advisories.find(name);
        if (it == advisories.end()) {
            continue;
        }
        PresentPackage present{.name = name,
                               .installed = std::move(versions),
                               .affected = {},
                               .affected_omitted = 0};
        for (const auto& version : it->second | std::views::take(kMaxAffectedListed)) {
            present.affected.push_back(version);
        }
        present.affected_omitted = it->second.size() - present.affected.size();
        summary.present.push_back(std::move(present));
    }

    summary.critical_count = static_cast<std::size_t>(
        std::ranges::count(findings, matcher::Level::kCritical, &matcher::Finding::level));
    summary.warning_count = findings.size() - summary.critical_count;
    return summary;
}

int exit_code_for(const std::vector<matcher::Finding>& findings) noexcept
{
    const bool has_critical = std::ranges::any_of(findings, [](const matcher::Finding& finding) {
        return finding.level == matcher::Level::kCritical;
    });
    return has_critical ? 2 : 0;
}

std::vector<std::string> render_text(const std::vector<matcher::Finding>& findings,
                                     const ScanSummary& summary,
                                     const ReportOptions& options)
{
    std::vector<std::string> lines;
    lines.reserve(findings.size() + summary.present.size() + 4);
    for (const auto& finding : findings) {
        lines.push_back(finding_line(finding, options));
    }

    if (findings.empty()) {
        lines.push_back(
            paint("No critical or adjacent versions found.", Style::kGreen, options.color));
    } else {
        const std::string text = std::format("Summary: {} critical, {} warning{}",
                                             summary.critical_count,
                                             summary.warning_count,
                                             summary.warning_count == 1 ? "" : "s");
        lines.push_back(
            paint(text, summary.critical_count > 0 ? Style::kRed : Style::kYellow, options.color));
    }

    lines.push_back(std::format("Scanned {} packages ({} names).",
                                summary.installed_count,
                                summary.name_count));
    lines.push_back(std::format("DB package names: {}", summary.advisory_name_count));
    lines.push_back(std::format("DB packages present: {}", summary.present.size()));
    for (const auto& present : summary.present) {
        lines.push_back(present_line(present, options.color));
    }
    return lines;
}

nlohmann::json build_json_report(const std::vector<matcher::Finding>& findings,
                                 const ScanSummary& summary,
                                 const ReportOptions& options)
{
    nlohmann::json finding_list = nlohmann::json::array();
    for (const auto& finding : findings) {
        finding_list.push_back({
            {  "level", std::string(matcher::level_name(finding.level))},
            {   "name",                       finding.name},
            {"version",                    finding.version},
            {"against",                    finding.against}
        });
    }

    nlohmann::json present_list = nlohmann::json::array();
    for (const auto& present : summary.present) {
        present_list.push_back({
            {            "name",             present.name},
            {       "installed",        present.installed},
            {        "affected",         present.affected},
            {"affected_omitted", present.affected_omitted}
        });
    }

    return {
        {"schema_version",                                     kReportSchemaVersion},
        {          "tool",
         {{"name", "wormscan"}, {"version", kVersion}, {"build_id", kBuildId}}     },
        {      "settings",
         {{"patch_distance", options.patch_distance}, {"ecosystem", options.ecosystem}}},
        {       "summary",
         {{"critical", summary.critical_count},
         {"warning", summary.warning_count},
         {"installed", summary.installed_count},
         {"names", summary.name_count},
         {"advisory_names", summary.advisory_name_count},
         {"present", summary.present.size()}}                                      },
        {      "findings",                                             finding_list},
        {       "present",                                             present_list}
    };
}

wormscan::Result<ReportOutput> build_report(const std::vector<matcher::Finding>& findings,
                                            const ScanSummary& summary,
                                            const ReportOptions& options)
{
    ReportOutput output{.format = options.format, .json = nlohmann::json{}, .text = {}};
    if (options.format == ReportFormat::kText) {
        output.text = render_text(findings, summary, options);
        return output;
    }

    output.json = build_json_report(findings, summary, options);
    const std::filesystem::path schema_path =
        std::filesystem::path(options.schema_dir) / "scan_report.v1.schema.json";
    if (auto validation = wormscan::common::validate_json(output.json, schema_path);
        !validation) {
        return std::unexpected(wormscan::Error::make(
            "SchemaInvalid",
            std::string("scan_report schema validation failed: ") + validation.error().message));
    }
    return output;
}

wormscan::VoidResult write_report(const ReportOptions& options, const ReportOutput& output)
{
    std::vector<std::string> lines = output.text;
    if (output.format == ReportFormat::kJson) {
        auto serialized = serialize_report(output.json);
        if (!serialized) {
            return std::unexpected(serialized.error());
        }
        lines = {std::move(*serialized)};
    }

    if (options.output_path) {
        return write_lines(*options.output_path, lines);
    }
    for (const auto& line : lines) {
        std::println("{}", line);
    }
    return {};
}

}  // namespace wormscan::report
