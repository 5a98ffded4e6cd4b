/**
 * @file DimensionalityReducer.hpp
 * @brief Truncated SVD projection of a batch of embeddings.
 */

#pragma once

#include <Eigen/Dense>

#include "domain/Result.hpp"
#include "domain/TextSegment.hpp"

namespace thoughtflow::application::clustering {

/**
 * @class DimensionalityReducer
 * @brief Projects samples onto their leading singular directions (U * S, uncentered).
 */
class DimensionalityReducer {
public:
    explicit DimensionalityReducer(int components = 50);

    /**
     * @brief Reduces @p vectors to at most min(components, features, samples) columns.
     * Column signs are fixed so the largest absolute entry of each column is positive.
     * @return One row per input vector, or ClusteringDegenerate / InputError.
     */
    domain::Result<Eigen::MatrixXd> reduce(const domain::EmbeddingMatrix& vectors) const;

    /** @brief Number of columns reduce() will produce for a given input shape. */
    int effectiveComponents(int sampleCount, int featureCount) const;

private:
    int m_components;
};

} // namespace thoughtflow::application::clustering
