/**
 * @file AdaptiveParameterPolicy.hpp
 * @brief Depth ceiling and minimum group size per recursion level.
 */

#pragma once

#include "domain/ClusterTree.hpp"

namespace thoughtflow::application::clustering {

/**
 * @class AdaptiveParameterPolicy
 * @brief Shrinks the depth ceiling and raises the size floor as recursion deepens.
 */
class AdaptiveParameterPolicy {
public:
    explicit AdaptiveParameterPolicy(double clusterSizeRatio = 0.15);

    /**
     * @brief Limits for a subtree of @p sampleCount samples at @p currentDepth.
     * @return maxDepth = max(1, baseMaxDepth - currentDepth / 2),
     *         minSize = max(baseMinSize, max(1, ceil(sampleCount * ratio))).
     */
    domain::ConstructionLimits computeLimits(int sampleCount, int currentDepth,
                                             int baseMaxDepth, int baseMinSize) const;

    double ratio() const { return m_ratio; }

private:
    double m_ratio;
};

} // namespace thoughtflow::application::clustering
