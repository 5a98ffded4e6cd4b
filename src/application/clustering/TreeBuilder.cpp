/**
 * @file TreeBuilder.cpp
 * @brief Implementation of TreeBuilder.
 */

#include "application/clustering/TreeBuilder.hpp"

#include <algorithm>
#include <iostream>
#include <map>

namespace thoughtflow::application::clustering {

using domain::ClusterNode;
using domain::ClusterTree;
using domain::LeafReason;
using domain::NodeIndex;
using domain::NodeKind;

TreeBuilder::TreeBuilder(const domain::MindmapSettings& settings)
    : m_settings(settings),
      m_policy(settings.clusterSizeRatio),
      m_reducer(settings.svdComponents) {}

domain::ConstructionLimits TreeBuilder::baseLimits() const {
    domain::ConstructionLimits limits;
    limits.maxDepth = std::max(1, m_settings.maxDepth);
    limits.minSize = std::max(1, m_settings.minSize);
    return limits;
}

int TreeBuilder::ChooseClusterCount(int depth, int sampleCount) {
    return std::max(2, std::min(2 + depth, sampleCount));
}

ClusterTree TreeBuilder::build(const std::vector<domain::TextSegment>& segments,
                               const domain::EmbeddingMatrix& embeddings) const {
    ClusterTree tree;
    std::vector<int> members;
    members.reserve(segments.size());
    for (const auto& segment : segments) {
        members.push_back(segment.index);
    }
    std::sort(members.begin(), members.end());

    const domain::ConstructionLimits rootLimits = baseLimits();

    std::cout << "[TreeBuilder] Building tree over " << members.size() << " segments (maxDepth="
              << rootLimits.maxDepth << ", minSize=" << rootLimits.minSize << ")" << std::endl;
    buildSubtree(tree, members, embeddings, 0, "root", rootLimits, std::nullopt);
    std::cout << "[TreeBuilder] Tree complete: " << tree.size() << " nodes, "
              << tree.leaves().size() << " leaves." << std::endl;
    return tree;
}

NodeIndex TreeBuilder::buildSubtree(ClusterTree& tree,
                                    const std::vector<int>& members,
                                    const domain::EmbeddingMatrix& embeddings,
                                    int depth,
                                    const std::string& clusterId,
                                    const domain::ConstructionLimits& limits,
                                    std::optional<NodeIndex> parent) const {
    ClusterNode node;
    node.id = clusterId;
    node.depth = depth;
    node.limits = limits;
    node.memberIndices = members;

    const int n = static_cast<int>(members.size());
    if (n < limits.minSize) {
        node.leafReason = LeafReason::BelowMinSize;
        return tree.addNode(std::move(node), parent);
    }
    if (depth >= limits.maxDepth) {
        node.leafReason = LeafReason::DepthLimit;
        return tree.addNode(std::move(node), parent);
    }

    domain::EmbeddingMatrix subset;
    subset.reserve(members.size());
    for (int idx : members) {
        subset.push_back(embeddings.at(static_cast<std::size_t>(idx)));
    }

    auto reduced = m_reducer.reduce(subset);
    if (!reduced) {
        std::cerr << "[TreeBuilder] " << clusterId << ": reduction failed ("
                  << reduced.error().message << "), keeping as leaf." << std::endl;
        node.leafReason = LeafReason::ClusteringDegenerate;
        return tree.addNode(std::move(node), parent);
    }

    const int k = ChooseClusterCount(depth, n);
    auto labels = m_partitioner.partition(reduced.value(), k);
    if (!labels) {
        std::cerr << "[TreeBuilder] " << clusterId << ": partitioning failed ("
                  << labels.error().message << "), keeping as leaf." << std::endl;
        node.leafReason = LeafReason::ClusteringDegenerate;
        return tree.addNode(std::move(node), parent);
    }

    std::cout << "[TreeBuilder] Clustering " << clusterId << " (" << n << " samples) into "
              << k << " groups" << std::endl;

    // Group label -> global indices, kept ascending.
    std::map<int, std::vector<int>> groups;
    const auto& assignment = labels.value();
    for (std::size_t i = 0; i < assignment.size(); ++i) {
        groups[assignment[i]].push_back(members[i]);
    }

    node.kind = NodeKind::Internal;
    node.leafReason = LeafReason::None;
    const NodeIndex self = tree.addNode(std::move(node), parent);

    // Children derive from the configured base, never from this node's limits.
    const domain::ConstructionLimits base = baseLimits();
    const domain::ConstructionLimits childLimits =
        m_policy.computeLimits(n, depth, base.maxDepth, base.minSize);

    for (const auto& [groupLabel, groupMembers] : groups) {
        if (groupMembers.empty()) continue;
        buildSubtree(tree, groupMembers, embeddings, depth + 1,
                     clusterId + "_" + std::to_string(groupLabel), childLimits, self);
    }
    return self;
}

} // namespace thoughtflow::application::clustering
