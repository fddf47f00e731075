/**
 * @file matcher.cpp
 * @brief Exact and patch-distance matching
 */

#include "wormscan/matcher.hpp"

#include "wormscan/semver.hpp"

#include <algorithm>
#include <optional>
#include <utility>

namespace wormscan::matcher {

namespace {

[[nodiscard]] std::uint64_t patch_delta(std::uint64_t a, std::uint64_t b) noexcept
{
    return a > b ? a - b : b - a;
}

[[nodiscard]] std::optional<Finding> classify(const deptree::InstalledPackage& package,
                                              const advisory::VersionSet& blocked,
                                              const MatchOptions& options)
{
    if (blocked.contains(package.version)) {
        return Finding{.level = Level::kCritical,
                       .name = package.name,
                       .version = package.version,
                       .against = package.version};
    }

    const auto installed = semver::parse(package.version);
    if (!installed) {
        return std::nullopt;
    }

    // VersionSet iterates in ascending version order, which fixes the winner
    // when several advisory versions are within range.
    for (const auto& candidate : blocked) {
        if (candidate == package.version) {
            return Finding{.level = Level::kCritical,
                           .name = package.name,
                           .version = package.version,
                           .against = package.version};
        }
        const auto parsed = semver::parse(candidate);
        if (!parsed) {
            continue;
        }
        if (parsed->major != installed->major || parsed->minor != installed->minor) {
            continue;
        }
        if (patch_delta(parsed->patch, installed->patch) <= options.patch_distance) {
            return Finding{.level = Level::kWarning,
                           .name = package.name,
                           .version = package.version,
                           .against = candidate};
        }
    }
    return std::nullopt;
}

}  // namespace

std::vector<Finding> match_packages(const std::vector<deptree::InstalledPackage>& installed,
                                    const advisory::AdvisoryMap& advisories,
                                    const MatchOptions& options)
{
    std::vector<Finding> findings;
    for (const auto& package : installed) {
        const auto it = advisories.find(package.name);
        if (it == advisories.end()) {
            continue;
        }
        if (auto finding = classify(package, it->second, options)) {
            findings.push_back(std::move(*finding));
        }
    }
    sort_findings(findings);
    return findings;
}

void sort_findings(std::vector<Finding>& findings)
{
    std::ranges::stable_sort(findings, [](const Finding& a, const Finding& b) {
        if (a.level != b.level) {
            return a.level == Level::kCritical;
        }
        if (a.name != b.name) {
            return a.name < b.name;
        }
        return semver::VersionLess{}(a.version, b.version);
    });
}

std::string_view level_name(Level level) noexcept
{
    switch (level) {
        case Level::kCritical:
            return "critical";
        case Level::kWarning:
            return "warning";
    }
    return "unknown";
}

}  // namespace wormscan::matcher
