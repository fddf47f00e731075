#pragma once

/**
 * @file deptree.hpp
 * @brief Resolved dependency graph and its flattening into installed packages
 */

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace wormscan::deptree {

struct InstalledPackage
{
    std::string name;
    std::string version;

    friend bool operator==(const InstalledPackage&, const InstalledPackage&) = default;
};

/**
 * @brief Dependency graph with nodes addressed by identity
 *
 * A node may be the child of several parents, or of itself through a longer
 * path. Nodes carry an optional name and version; edges carry the dependency
 * key the child was listed under.
 */
class DependencyGraph
{
public:
    using NodeId = std::size_t;

    struct Edge
    {
        std::string key;
        NodeId child;
    };

    struct Node
    {
        std::optional<std::string> name;
        std::optional<std::string> version;
        std::vector<Edge> dependencies;
    };

    /**
     * Build a graph from an `npm ls --json` style tree.
     * A missing or non-object root gives an empty graph.
     */
    [[nodiscard]] static DependencyGraph from_json(const nlohmann::json& root);

    /**
     * Add a node. The first node added is the root.
     */
    NodeId add_node(std::optional<std::string> name, std::optional<std::string> version);

    /**
     * Add an edge; ids must come from add_node() on this graph.
     */
    void add_dependency(NodeId parent, std::string key, NodeId child);

    [[nodiscard]] bool empty() const noexcept { return m_nodes.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return m_nodes.size(); }
    [[nodiscard]] NodeId root() const noexcept { return 0; }
    [[nodiscard]] const Node& node(NodeId id) const { return m_nodes.at(id); }

private:
    std::vector<Node> m_nodes;
};

/**
 * Flatten the graph into distinct (name, version) pairs.
 *
 * Depth-first from the root. A node's name is its own, else the key it was
 * reached under. Nodes lacking a name or version are not emitted but their
 * children are still visited. A node reached again while it is on the
 * current path, or after it was fully expanded, is not expanded again.
 *
 * @return Packages sorted by name, then by version order
 */
[[nodiscard]] std::vector<InstalledPackage> flatten_packages(const DependencyGraph& graph);

/**
 * Convenience overload for a decoded `npm ls --json` tree.
 */
[[nodiscard]] std::vector<InstalledPackage> flatten_packages(const nlohmann::json& tree);

/**
 * Sort by name, then version order; the order used for every package list.
 */
void sort_packages(std::vector<InstalledPackage>& packages);

}  // namespace wormscan::deptree
