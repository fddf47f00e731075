/**
 * @file test_scan_determinism.cpp
 * @brief Identical scan inputs in any order give byte-identical reports
 */

#include "wormscan/advisory.hpp"
#include "wormscan/deptree.hpp"
#include "wormscan/matcher.hpp"
#include "wormscan/report.hpp"

#include <algorithm>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace {

using wormscan::deptree::DependencyGraph;
using Json = nlohmann::json;

struct Dependency
{
    std::string key;
    std::string version;
};

const std::vector<Dependency> kDependencies = {
    {        "evil",   "1.2.3"},
    {         "pkg",   "2.5.6"},
    {         "pkg",   "2.5.8"},
    {    "left-pad",   "1.3.0"},
    {       "chalk",   "4.1.2"},
    {  "color-name",   "1.1.4"},
    {      "lodash", "4.17.21"},
    {"event-stream",   "3.3.6"},
    {"ua-parser-js",  "0.7.29"},
    {         "abc",  "v1.0.0"},
};

[[nodiscard]] Json feed_records()
{
    return Json::parse(R"([
        {"name":"evil","version":"1.2.3"},
        {"package":"pkg","versions":["2.5.7","2.5.9"]},
        {"name":"event-stream","affected_versions":["3.3.6","3.3.5"],"ecosystem":"npm"},
        {"name":"ua-parser-js","versions":["0.7.29","0.8.0","1.0.0"]},
        {"name":"abc","version":"1.0.0"},
        {"name":"lodash","version":"4.17.20"},
        {"name":"requests","version":"2.0.0","ecosystem":"pypi"}
    ])");
}

/**
 * Build a two-level graph: every dependency hangs off the root and is also
 * shared under a hub node, with edges added in the given order.
 */
[[nodiscard]] DependencyGraph build_graph(const std::vector<Dependency>& order)
{
    DependencyGraph graph;
    const auto root = graph.add_node("app", "1.0.0");
    const auto hub = graph.add_node("hub", "0.0.1");
    graph.add_dependency(root, "hub", hub);
    for (const auto& dependency : order) {
        const auto child = graph.add_node(std::nullopt, dependency.version);
        graph.add_dependency(root, dependency.key, child);
        graph.add_dependency(hub, dependency.key, child);
    }
    return graph;
}

[[nodiscard]] std::string run_scan(const Json& feed, const std::vector<Dependency>& order)
{
    const auto advisories = wormscan::advisory::normalize(feed);
    const auto installed = wormscan::deptree::flatten_packages(build_graph(order));
    const auto findings = wormscan::matcher::match_packages(installed, advisories);
    const auto summary = wormscan::report::summarize(installed, advisories, findings);
    const wormscan::report::ReportOptions options;
    auto serialized = wormscan::report::serialize_report(
        wormscan::report::build_json_report(findings, summary, options));
    EXPECT_TRUE(serialized.has_value());
    return serialized.value_or(std::string{});
}

TEST(ScanDeterminism, ShuffledInputsSameReport)
{
    const auto baseline = run_scan(feed_records(), kDependencies);
    ASSERT_FALSE(baseline.empty());

    std::mt19937 rng(20250916U);
    for (int round = 0; round < 25; ++round) {
        auto records = feed_records();
        std::ranges::shuffle(records.get_ref<Json::array_t&>(), rng);
        auto order = kDependencies;
        std::ranges::shuffle(order, rng);
        EXPECT_EQ(run_scan(records, order), baseline) << "round " << round;
    }
}

TEST(ScanDeterminism, ExpectedFindings)
{
    const auto advisories = wormscan::advisory::normalize(feed_records());
    const auto installed = wormscan::deptree::flatten_packages(build_graph(kDependencies));
    const auto findings = wormscan::matcher::match_packages(installed, advisories);

    std::vector<std::pair<std::string, std::string>> seen;
    for (const auto& finding : findings) {
        seen.emplace_back(std::string(wormscan::matcher::level_name(finding.level)),
                          finding.name + "@" + finding.version + "~" + finding.against);
    }
    const std::vector<std::pair<std::string, std::string>> expected = {
        {"critical",   "event-stream@3.3.6~3.3.6"},
        {"critical",           "evil@1.2.3~1.2.3"},
        {"critical", "ua-parser-js@0.7.29~0.7.29"},
        { "warning",            "abc@v1.0.0~1.0.0"},
        { "warning",     "lodash@4.17.21~4.17.20"},
        { "warning",             "pkg@2.5.6~2.5.7"},
        { "warning",             "pkg@2.5.8~2.5.7"},
    };
    EXPECT_EQ(seen, expected);
}

}  // namespace
