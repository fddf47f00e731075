#pragma once

/**
 * @file advisory.hpp
 * @brief Advisory feed normalization into a name -> malicious versions map
 *
 * The feed's shape is not fixed. Records, keyed maps and wrapper objects are
 * recognized by a table of independent rules; every matching rule
 * contributes facts and unrecognized structure is ignored.
 */

#include "wormscan/semver.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <set>
#include <string>

#include <nlohmann/json.hpp>

namespace wormscan::advisory {

/// Malicious versions of one package, iterated in ascending version order
using VersionSet = std::set<std::string, semver::VersionLess>;

/// Package name (exact, case-sensitive) -> malicious versions; no empty sets
using AdvisoryMap = std::map<std::string, VersionSet, std::less<>>;

struct NormalizeOptions
{
    /// Records tagged with another ecosystem (case-insensitive) are skipped
    std::string ecosystem = "npm";
};

/**
 * Reduce a decoded advisory feed to an AdvisoryMap.
 *
 * Never throws on unexpected shapes; anything unrecognized contributes
 * nothing.
 *
 * @param feed Decoded feed (object, array or scalar)
 * @param options Normalization options
 * @return Canonical advisory map
 */
[[nodiscard]] AdvisoryMap normalize(const nlohmann::json& feed,
                                    const NormalizeOptions& options = {});

/**
 * Total number of (name, version) facts in the map
 */
[[nodiscard]] std::size_t fact_count(const AdvisoryMap& map);

}  // namespace wormscan::advisory
