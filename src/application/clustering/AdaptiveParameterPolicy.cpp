/**
 * @file AdaptiveParameterPolicy.cpp
 * @brief Implementation of AdaptiveParameterPolicy.
 */

#include "application/clustering/AdaptiveParameterPolicy.hpp"

#include <algorithm>
#include <cmath>

namespace thoughtflow::application::clustering {

AdaptiveParameterPolicy::AdaptiveParameterPolicy(double clusterSizeRatio)
    : m_ratio(clusterSizeRatio) {}

domain::ConstructionLimits AdaptiveParameterPolicy::computeLimits(int sampleCount, int currentDepth,
                                                                  int baseMaxDepth, int baseMinSize) const {
    domain::ConstructionLimits limits;
    limits.maxDepth = std::max(1, baseMaxDepth - currentDepth / 2);

    const int ratioTerm = static_cast<int>(std::ceil(static_cast<double>(sampleCount) * m_ratio));
    limits.minSize = std::max(baseMinSize, std::max(1, ratioTerm));
    return limits;
}

} // namespace thoughtflow::application::clustering
