#pragma once

/**
 * @file matcher.hpp
 * @brief Classification of installed packages against the advisory map
 */

#include "wormscan/advisory.hpp"
#include "wormscan/deptree.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace wormscan::matcher {

/**
 * Finding severity
 *
 * Naming convention: kPascalCase for enum constants (Google C++ Style Guide)
 */
enum class Level {
    kCritical,  ///< Installed version is listed as malicious
    kWarning    ///< Same major.minor, patch within the configured distance
};

struct Finding
{
    Level level;
    std::string name;
    std::string version;
    std::string against;  ///< Advisory version the package was matched against

    friend bool operator==(const Finding&, const Finding&) = default;
};

struct MatchOptions
{
    std::uint64_t patch_distance = 1;
};

/**
 * Classify every installed package.
 *
 * Packages whose name is not in the advisory map are clean. An exact
 * version string match is critical. Otherwise, for a parseable version, the
 * advisory versions are scanned in ascending order and the first one with
 * the same major.minor and a patch within the distance is a warning.
 *
 * @return At most one finding per package; critical first, then by name,
 *         then by version order
 */
[[nodiscard]] std::vector<Finding> match_packages(
    const std::vector<deptree::InstalledPackage>& installed,
    const advisory::AdvisoryMap& advisories,
    const MatchOptions& options = {});

/**
 * Sort findings: critical before warning, then name, then version order
 */
void sort_findings(std::vector<Finding>& findings);

[[nodiscard]] std::string_view level_name(Level level) noexcept;

}  // namespace wormscan::matcher
