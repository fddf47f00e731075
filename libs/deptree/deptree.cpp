/**
 * @file deptree.cpp
 * @brief Dependency graph construction and flattening
 */

#include "wormscan/deptree.hpp"

#include "wormscan/semver.hpp"

#include <algorithm>
#include <cstdint>
#include <set>
#include <string_view>
#include <utility>

namespace wormscan::deptree {

namespace {

[[nodiscard]] std::optional<std::string> string_field(const nlohmann::json& node,
                                                      std::string_view key)
{
    const auto it = node.find(key);
    if (it == node.end() || !it->is_string() || it->get_ref<const std::string&>().empty()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

enum class Mark : std::uint8_t {
    kUnvisited,
    kInProgress,  ///< On the current traversal path
    kExpanded     ///< Every descendant already visited
};

}  // namespace

DependencyGraph DependencyGraph::from_json(const nlohmann::json& root)
{
    DependencyGraph graph;
    if (!root.is_object()) {
        return graph;
    }

    struct Pending
    {
        const nlohmann::json* json;
        NodeId id;
    };
    std::vector<Pending> pending;
    pending.push_back(
        {.json = &root,
         .id = graph.add_node(string_field(root, "name"), string_field(root, "version"))});

    while (!pending.empty()) {
        const Pending current = pending.back();
        pending.pop_back();

        const auto deps = current.json->find("dependencies");
        if (deps == current.json->end() || !deps->is_object()) {
            continue;
        }
        for (const auto& [key, child] : deps->items()) {
            if (!child.is_object()) {
                continue;
            }
            const NodeId child_id =
                graph.add_node(string_field(child, "name"), string_field(child, "version"));
            graph.add_dependency(current.id, key, child_id);
            pending.push_back({.json = &child, .id = child_id});
        }
    }
    return graph;
}

DependencyGraph::NodeId DependencyGraph::add_node(std::optional<std::string> name,
                                                  std::optional<std::string> version)
{
    m_nodes.push_back(
        Node{.name = std::move(name), .version = std::move(version), .dependencies = {}});
    return m_nodes.size() - 1;
}

void DependencyGraph::add_dependency(NodeId parent, std::string key, NodeId child)
{
    m_nodes.at(parent).dependencies.push_back(Edge{.key = std::move(key), .child = child});
}

std::vector<InstalledPackage> flatten_packages(const DependencyGraph& graph)
{
    std::vector<InstalledPackage> results;
    if (graph.empty()) {
        return results;
    }

    using NodeId = DependencyGraph::NodeId;

    struct Frame
    {
        NodeId id;
        std::size_t next_edge;
    };

    std::vector<Mark> marks(graph.size(), Mark::kUnvisited);
    std::set<std::pair<std::string, std::string>, std::less<>> seen;
    std::vector<Frame> stack;

    // Emit the node under the name it resolves to here, then descend only if
    // it is neither on the current path nor already expanded.
    const auto enter = [&](NodeId id, std::string_view reached_as) {
        const auto& node = graph.node(id);
        const std::string_view name = node.name ? std::string_view(*node.name) : reached_as;
        if (!name.empty() && node.version && !node.version->empty()) {
            auto [_, inserted] = seen.emplace(std::string(name), *node.version);
            if (inserted) {
                results.push_back(
                    InstalledPackage{.name = std::string(name), .version = *node.version});
            }
        }
        if (marks.at(id) != Mark::kUnvisited) {
            return;
        }
        marks.at(id) = Mark::kInProgress;
        stack.push_back(Frame{.id = id, .next_edge = 0});
    };

    enter(graph.root(), {});
    while (!stack.empty()) {
        Frame& frame = stack.back();
        const auto& node = graph.node(frame.id);
        if (frame.next_edge >= node.dependencies.size()) {
            marks.at(frame.id) = Mark::kExpanded;
            stack.pop_back();
            continue;
        }
        const auto& edge = node.dependencies[frame.next_edge];
        ++frame.next_edge;
        enter(edge.child, edge.key);
    }

    sort_packages(results);
    return results;
}

std::vector<InstalledPackage> flatten_packages(const nlohmann::json& tree)
{
    return flatten_packages(DependencyGraph::from_json(tree));
}

void sort_packages(std::vector<InstalledPackage>& packages)
{
    std::ranges::stable_sort(packages, [](const InstalledPackage& a, const InstalledPackage& b) {
        if (a.name != b.name) {
            return a.name < b.name;
        }
        return semver::VersionLess{}(a.version, b.version);
    });
}

}  // namespace wormscan::deptree
