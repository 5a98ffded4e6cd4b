/**
 * @file ClusterPartitioner.hpp
 * @brief Deterministic Ward agglomerative clustering into a fixed number of groups.
 */

#pragma once

#include <vector>

#include <Eigen/Dense>

#include "domain/Result.hpp"

namespace thoughtflow::application::clustering {

/**
 * @class ClusterPartitioner
 * @brief Merges the closest pair of clusters (Ward linkage) until k remain.
 *
 * Ties: active clusters are scanned in row-major (i < j) order and only a
 * strictly smaller distance replaces the current best, so the lowest pair wins.
 * Group labels are numbered by each group's smallest sample index.
 */
class ClusterPartitioner {
public:
    /**
     * @brief Partitions the rows of @p points.
     * @param points One sample per row.
     * @param k Number of groups, 2 <= k <= rows.
     * @return Group label per row, or ClusteringDegenerate.
     */
    domain::Result<std::vector<int>> partition(const Eigen::MatrixXd& points, int k) const;
};

} // namespace thoughtflow::application::clustering
