/**
 * @file TreeBuilder.hpp
 * @brief Recursive construction of the unlabeled mindmap tree.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "application/clustering/AdaptiveParameterPolicy.hpp"
#include "application/clustering/ClusterPartitioner.hpp"
#include "application/clustering/DimensionalityReducer.hpp"
#include "domain/ClusterTree.hpp"
#include "domain/MindmapSettings.hpp"
#include "domain/TextSegment.hpp"

namespace thoughtflow::application::clustering {

/**
 * @class TreeBuilder
 * @brief Grows the tree depth-first: reduce, partition, recurse per group.
 *
 * A reduction or partitioning failure demotes the node to a leaf; it never
 * aborts the build.
 */
class TreeBuilder {
public:
    explicit TreeBuilder(const domain::MindmapSettings& settings);

    /**
     * @brief Builds the whole tree rooted at "root".
     * @param segments Segments, indexed 0..n-1.
     * @param embeddings One vector per segment, same order.
     */
    domain::ClusterTree build(const std::vector<domain::TextSegment>& segments,
                              const domain::EmbeddingMatrix& embeddings) const;

    /**
     * @brief Builds the subtree for @p members and appends it to @p tree.
     * @param members Global segment indices, ascending.
     * @param limits Limits in force for this node, computed by its parent.
     * @return Index of the subtree root in @p tree.
     */
    domain::NodeIndex buildSubtree(domain::ClusterTree& tree,
                                   const std::vector<int>& members,
                                   const domain::EmbeddingMatrix& embeddings,
                                   int depth,
                                   const std::string& clusterId,
                                   const domain::ConstructionLimits& limits,
                                   std::optional<domain::NodeIndex> parent) const;

    /** @brief Branching factor at @p depth: max(2, min(2 + depth, sampleCount)). */
    static int ChooseClusterCount(int depth, int sampleCount);

    /** @brief Configured maximum depth and minimum size, each at least 1. Also the root's limits. */
    domain::ConstructionLimits baseLimits() const;

private:
    domain::MindmapSettings m_settings;
    AdaptiveParameterPolicy m_policy;
    DimensionalityReducer m_reducer;
    ClusterPartitioner m_partitioner;
};

} // namespace thoughtflow::application::clustering
