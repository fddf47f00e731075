/**
 * @file test_matcher.cpp
 * @brief Critical / warning classification tests
 */

#include "wormscan/matcher.hpp"

#include <initializer_list>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace {

using wormscan::advisory::AdvisoryMap;
using wormscan::deptree::InstalledPackage;
using wormscan::matcher::Finding;
using wormscan::matcher::Level;
using wormscan::matcher::match_packages;

[[nodiscard]] AdvisoryMap advisories(const std::string& name,
                                     std::initializer_list<const char*> versions)
{
    AdvisoryMap map;
    for (const auto* version : versions) {
        map[name].insert(version);
    }
    return map;
}

TEST(Matcher, ExactMatchIsCritical)
{
    const std::vector<InstalledPackage> installed = {
        {.name = "evil", .version = "1.2.3"}
    };
    const auto findings = match_packages(installed, advisories("evil", {"1.2.3"}));
    const std::vector<Finding> expected = {
        {.level = Level::kCritical, .name = "evil", .version = "1.2.3", .against = "1.2.3"}
    };
    EXPECT_EQ(findings, expected);
}

TEST(Matcher, AdjacentPatchIsWarning)
{
    const auto map = advisories("pkg", {"2.5.7"});
    for (const auto* version : {"2.5.6", "2.5.8"}) {
        const std::vector<InstalledPackage> installed = {
            {.name = "pkg", .version = version}
        };
        const auto findings = match_packages(installed, map);
        ASSERT_EQ(findings.size(), 1U) << version;
        EXPECT_EQ(findings[0].level, Level::kWarning);
        EXPECT_EQ(findings[0].against, "2.5.7");
    }
}

TEST(Matcher, OutsideDistanceIsClean)
{
    const std::vector<InstalledPackage> installed = {
        {.name = "pkg", .version = "2.5.9"},
        {.name = "pkg", .version = "2.6.7"},
        {.name = "pkg", .version = "3.5.7"}
    };
    EXPECT_TRUE(match_packages(installed, advisories("pkg", {"2.5.7"})).empty());
}

TEST(Matcher, DistanceIsConfigurable)
{
    const std::vector<InstalledPackage> installed = {
        {.name = "pkg", .version = "2.5.9"}
    };
    const auto map = advisories("pkg", {"2.5.7"});
    EXPECT_EQ(match_packages(installed, map, {.patch_distance = 2}).size(), 1U);
    EXPECT_TRUE(match_packages(installed, map, {.patch_distance = 0}).empty());
}

TEST(Matcher, ZeroDistanceMatchesEquivalentSpelling)
{
    const std::vector<InstalledPackage> installed = {
        {.name = "pkg", .version = "v2.5.7"}
    };
    const auto findings =
        match_packages(installed, advisories("pkg", {"2.5.7"}), {.patch_distance = 0});
    ASSERT_EQ(findings.size(), 1U);
    EXPECT_EQ(findings[0].level, Level::kWarning);
}

TEST(Matcher, UnknownNameIsClean)
{
    const std::vector<InstalledPackage> installed = {
        {.name = "safe", .version = "1.2.3"}
    };
    EXPECT_TRUE(match_packages(installed, advisories("evil", {"1.2.3"})).empty());
}

TEST(Matcher, NameMatchIsCaseSensitive)
{
    const std::vector<InstalledPackage> installed = {
        {.name = "Evil", .version = "1.2.3"}
    };
    EXPECT_TRUE(match_packages(installed, advisories("evil", {"1.2.3"})).empty());
}

TEST(Matcher, UnparsableInstalledOnlyMatchesExactly)
{
    const auto map = advisories("pkg", {"latest", "1.0.0"});
    const std::vector<InstalledPackage> exact = {
        {.name = "pkg", .version = "latest"}
    };
    const std::vector<InstalledPackage> near = {
        {.name = "pkg", .version = "next"}
    };
    EXPECT_EQ(match_packages(exact, map).size(), 1U);
    EXPECT_TRUE(match_packages(near, map).empty());
}

TEST(Matcher, BuildSuffixIsNeverAdjacent)
{
    const std::vector<InstalledPackage> installed = {
        {.name = "pkg", .version = "2.5.6+build"}
    };
    EXPECT_TRUE(match_packages(installed, advisories("pkg", {"2.5.7"})).empty());
    EXPECT_EQ(match_packages(installed, advisories("pkg", {"2.5.6+build"})).size(), 1U);
}

TEST(Matcher, UnparsableAdvisoryVersionsSkippedForWarnings)
{
    const std::vector<InstalledPackage> installed = {
        {.name = "pkg", .version = "1.0.1"}
    };
    EXPECT_TRUE(match_packages(installed, advisories("pkg", {"1.0", "1.0.x"})).empty());
}

TEST(Matcher, LowestAdjacentVersionWins)
{
    const std::vector<InstalledPackage> installed = {
        {.name = "pkg", .version = "2.5.6"}
    };
    const auto findings = match_packages(
        installed, advisories("pkg", {"2.5.8", "2.5.5", "2.5.7"}), {.patch_distance = 2});
    ASSERT_EQ(findings.size(), 1U);
    EXPECT_EQ(findings[0].against, "2.5.5");
}

TEST(Matcher, CriticalBeatsWarningForSamePackage)
{
    const std::vector<InstalledPackage> installed = {
        {.name = "pkg", .version = "2.5.6"}
    };
    const auto findings = match_packages(installed, advisories("pkg", {"2.5.5", "2.5.6"}));
    ASSERT_EQ(findings.size(), 1U);
    EXPECT_EQ(findings[0].level, Level::kCritical);
    EXPECT_EQ(findings[0].against, "2.5.6");
}

TEST(Matcher, FindingsOrdering)
{
    AdvisoryMap map;
    map["alpha"].insert("1.0.1");
    map["zeta"].insert("1.0.0");
    map["beta"].insert("2.0.0");
    map["beta"].insert("10.0.0");
    const std::vector<InstalledPackage> installed = {
        {.name = "alpha", .version = "1.0.0"},
        {.name = "beta", .version = "10.0.0"},
        {.name = "beta", .version = "2.0.0"},
        {.name = "zeta", .version = "1.0.0"}
    };
    const std::vector<Finding> expected = {
        {.level = Level::kCritical, .name = "beta", .version = "2.0.0", .against = "2.0.0"},
        {.level = Level::kCritical, .name = "beta", .version = "10.0.0", .against = "10.0.0"},
        {.level = Level::kCritical, .name = "zeta", .version = "1.0.0", .against = "1.0.0"},
        {.level = Level::kWarning, .name = "alpha", .version = "1.0.0", .against = "1.0.1"}
    };
    EXPECT_EQ(match_packages(installed, map), expected);
}

TEST(Matcher, LevelNames)
{
    EXPECT_EQ(wormscan::matcher::level_name(Level::kCritical), "critical");
    EXPECT_EQ(wormscan::matcher::level_name(Level::kWarning), "warning");
}

}  // namespace
