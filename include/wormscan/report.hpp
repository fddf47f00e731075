#pragma once

/**
 * @file report.hpp
 * @brief Scan statistics and text/JSON report rendering
 */

#include "wormscan/advisory.hpp"
#include "wormscan/common.hpp"
#include "wormscan/deptree.hpp"
#include "wormscan/matcher.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace wormscan::report {

/// Affected versions listed per present package before eliding the rest
constexpr std::size_t kMaxAffectedListed = 10;

enum class ReportFormat { kText, kJson };

/**
 * An advisory-listed package that is installed
 */
struct PresentPackage
{
    std::string name;
    std::vector<std::string> installed;  ///< Installed versions, version order
    std::vector<std::string> affected;   ///< First kMaxAffectedListed advisory versions
    std::size_t affected_omitted = 0;    ///< Advisory versions not listed
};

struct ScanSummary
{
    std::size_t installed_count = 0;
    std::size_t name_count = 0;
    std::size_t advisory_name_count = 0;
    std::size_t critical_count = 0;
    std::size_t warning_count = 0;
    std::vector<PresentPackage> present;  ///< Sorted by name
};

struct ReportOptions
{
    ReportFormat format = ReportFormat::kText;
    std::optional<std::filesystem::path> output_path;
    std::string schema_dir = "schemas";
    bool color = true;
    std::uint64_t patch_distance = 1;
    std::string ecosystem = "npm";
};

struct ReportOutput
{
    ReportFormat format;
    nlohmann::json json;
    std::vector<std::string> text;
};

/**
 * Derive counts and the installed/advisory intersection.
 */
[[nodiscard]] ScanSummary summarize(const std::vector<deptree::InstalledPackage>& installed,
                                    const advisory::AdvisoryMap& advisories,
                                    const std::vector<matcher::Finding>& findings);

/**
 * Process exit status for a completed scan: 2 with any critical finding,
 * otherwise 0.
 */
[[nodiscard]] int exit_code_for(const std::vector<matcher::Finding>& findings) noexcept;

[[nodiscard]] std::vector<std::string> render_text(const std::vector<matcher::Finding>& findings,
                                                   const ScanSummary& summary,
                                                   const ReportOptions& options);

[[nodiscard]] nlohmann::json build_json_report(const std::vector<matcher::Finding>& findings,
                                               const ScanSummary& summary,
                                               const ReportOptions& options);

/**
 * Serialize a report document to its stable byte form: sorted keys, no
 * whitespace, strict UTF-8.
 * @return NonIntegerValue or NegativeCount naming the offending JSON pointer,
 *         InvalidUtf8 when a string is not valid UTF-8
 */
[[nodiscard]] wormscan::Result<std::string> serialize_report(const nlohmann::json& document);

/**
 * Render in the configured format. JSON output is validated against
 * scan_report.v1.schema.json under options.schema_dir.
 */
[[nodiscard]] wormscan::Result<ReportOutput> build_report(
    const std::vector<matcher::Finding>& findings,
    const ScanSummary& summary,
    const ReportOptions& options);

/**
 * Write to options.output_path, or to stdout when unset.
 */
[[nodiscard]] wormscan::VoidResult write_report(const ReportOptions& options,
                                                const ReportOutput& output);

}  // namespace wormscan::report
