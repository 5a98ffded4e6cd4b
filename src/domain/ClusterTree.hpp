/**
 * @file ClusterTree.hpp
 * @brief Arena-backed mindmap tree produced by the builder and filled by the enricher.
 */

#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "domain/Relationship.hpp"

namespace thoughtflow::domain {

/**
 * @enum NodeKind
 * @brief Fixed at construction; a Leaf never gains children.
 */
enum class NodeKind {
    Leaf,
    Internal
};

/**
 * @enum LeafReason
 * @brief Why the builder stopped subdividing a node.
 */
enum class LeafReason {
    None,                ///< Internal node.
    BelowMinSize,        ///< Fewer samples than the effective minimum size.
    DepthLimit,          ///< Depth reached the effective maximum depth.
    ClusteringDegenerate ///< Partitioning failed and the node was demoted.
};

std::string LeafReasonToString(LeafReason reason);

/**
 * @struct ConstructionLimits
 * @brief Limits in force when a node was built.
 */
struct ConstructionLimits {
    int maxDepth = 1;
    int minSize = 1;

    bool operator==(const ConstructionLimits& other) const {
        return maxDepth == other.maxDepth && minSize == other.minSize;
    }
};

using NodeIndex = std::size_t;

/**
 * @struct ClusterNode
 * @brief One topic of the mindmap.
 */
struct ClusterNode {
    std::string id;                      ///< Path id: root, root_0, root_0_2...
    int depth = 0;
    NodeKind kind = NodeKind::Leaf;
    LeafReason leafReason = LeafReason::None;
    ConstructionLimits limits;
    std::vector<int> memberIndices;      ///< Sorted ascending.
    std::vector<NodeIndex> children;     ///< Indices into the owning ClusterTree.
    std::optional<NodeIndex> parent;
    std::optional<std::string> label;
    std::optional<std::string> description;
    std::vector<Relationship> relationships; ///< Leaves only.
    double relationshipDensity = 0.0;

    bool isLeaf() const { return kind == NodeKind::Leaf; }
};

/**
 * @class ClusterTree
 * @brief Owns every node; parents refer to children by index.
 */
class ClusterTree {
public:
    /** @brief Adds a node and links it under @p parent. Returns the new index. */
    NodeIndex addNode(ClusterNode node, std::optional<NodeIndex> parent = std::nullopt);

    bool empty() const { return m_nodes.empty(); }
    std::size_t size() const { return m_nodes.size(); }

    NodeIndex rootIndex() const { return 0; }
    const ClusterNode& root() const { return m_nodes.at(0); }

    const ClusterNode& node(NodeIndex index) const { return m_nodes.at(index); }
    ClusterNode& node(NodeIndex index) { return m_nodes.at(index); }

    std::optional<NodeIndex> findById(const std::string& id) const;

    /** @brief Node indices in depth-first pre-order, children in stored order. */
    std::vector<NodeIndex> preOrder() const;

    std::vector<NodeIndex> leaves() const;

    /**
     * @brief Checks the structural invariants of a built tree.
     * @param errors Receives one message per violation.
     * @param requireLabels Also require a non-empty label on every node.
     * @return True when no invariant is violated.
     */
    bool validate(std::vector<std::string>& errors, bool requireLabels = false) const;

private:
    std::vector<ClusterNode> m_nodes;
    std::unordered_map<std::string, NodeIndex> m_idIndex;
};

} // namespace thoughtflow::domain
