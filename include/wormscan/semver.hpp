#pragma once

/**
 * @file semver.hpp
 * @brief major.minor.patch parsing and the version ordering used for every sort
 */

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace wormscan::semver {

struct ParsedVersion
{
    std::uint64_t major = 0;
    std::uint64_t minor = 0;
    std::uint64_t patch = 0;

    friend auto operator<=>(const ParsedVersion&, const ParsedVersion&) = default;
};

/**
 * Parse "major.minor.patch" with an optional leading 'v'.
 *
 * Segments past the third are ignored. The patch segment is cut at the first
 * '-' or '+' so prerelease and build suffixes are tolerated.
 *
 * @param input Version string
 * @return Parsed triple, or std::nullopt when the string does not conform
 */
[[nodiscard]] std::optional<ParsedVersion> parse(std::string_view input);

/**
 * Three-way comparison of two version strings.
 * - Both parse: numeric major, minor, patch
 * - One parses: the parsed one orders first
 * - Neither parses: lexicographic
 */
[[nodiscard]] std::strong_ordering compare(std::string_view a, std::string_view b);

/**
 * Strict weak ordering over version strings.
 *
 * Follows compare() and breaks ties between distinct strings that parse to
 * the same triple ("1.2.3" vs "v1.2.3") lexicographically, so it can key an
 * ordered set without collapsing different strings.
 */
struct VersionLess
{
    using is_transparent = void;

    [[nodiscard]] bool operator()(std::string_view a, std::string_view b) const
    {
        const auto order = compare(a, b);
        if (order != std::strong_ordering::equal) {
            return order == std::strong_ordering::less;
        }
        return a < b;
    }
};

/**
 * True when the string contains a dotted numeric run ("1.2", "v10.0.3-rc").
 */
[[nodiscard]] bool looks_like_version(std::string_view input);

}  // namespace wormscan::semver
