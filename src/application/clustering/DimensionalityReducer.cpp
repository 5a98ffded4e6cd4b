/**
 * @file DimensionalityReducer.cpp
 * @brief Implementation of DimensionalityReducer on top of Eigen's JacobiSVD.
 */

#include "application/clustering/DimensionalityReducer.hpp"

#include <Eigen/SVD>

#include <algorithm>
#include <cmath>

namespace thoughtflow::application::clustering {

using domain::ErrorKind;
using domain::Result;

DimensionalityReducer::DimensionalityReducer(int components) : m_components(components) {}

int DimensionalityReducer::effectiveComponents(int sampleCount, int featureCount) const {
    return std::min({m_components, featureCount, sampleCount});
}

Result<Eigen::MatrixXd> DimensionalityReducer::reduce(const domain::EmbeddingMatrix& vectors) const {
    if (m_components < 1) {
        return Result<Eigen::MatrixXd>::Fail(ErrorKind::InputError, "component count must be positive");
    }
    if (vectors.size() < 2) {
        return Result<Eigen::MatrixXd>::Fail(ErrorKind::ClusteringDegenerate,
                                             "need at least 2 samples to reduce");
    }

    const auto rows = static_cast<Eigen::Index>(vectors.size());
    const auto cols = static_cast<Eigen::Index>(vectors.front().size());
    if (cols == 0) {
        return Result<Eigen::MatrixXd>::Fail(ErrorKind::InputError, "embeddings have no features");
    }

    Eigen::MatrixXd data(rows, cols);
    for (Eigen::Index i = 0; i < rows; ++i) {
        const auto& v = vectors[static_cast<std::size_t>(i)];
        if (static_cast<Eigen::Index>(v.size()) != cols) {
            return Result<Eigen::MatrixXd>::Fail(ErrorKind::InputError, "embeddings have mixed dimensionality");
        }
        for (Eigen::Index j = 0; j < cols; ++j) {
            data(i, j) = static_cast<double>(v[static_cast<std::size_t>(j)]);
        }
    }
    if (!data.allFinite()) {
        return Result<Eigen::MatrixXd>::Fail(ErrorKind::ClusteringDegenerate, "embeddings contain non-finite values");
    }

    const int k = effectiveComponents(static_cast<int>(rows), static_cast<int>(cols));

    Eigen::JacobiSVD<Eigen::MatrixXd> svd(data, Eigen::ComputeThinU);
    const Eigen::VectorXd& singular = svd.singularValues();
    Eigen::MatrixXd reduced = svd.matrixU().leftCols(k) * singular.head(k).asDiagonal();

    // Deterministic signs: SVD leaves each singular vector's sign arbitrary.
    for (Eigen::Index c = 0; c < reduced.cols(); ++c) {
        Eigen::Index pivot = 0;
        reduced.col(c).cwiseAbs().maxCoeff(&pivot);
        if (reduced(pivot, c) < 0.0) {
            reduced.col(c) *= -1.0;
        }
    }

    if (!reduced.allFinite()) {
        return Result<Eigen::MatrixXd>::Fail(ErrorKind::ClusteringDegenerate, "SVD produced non-finite values");
    }
    return reduced;
}

} // namespace thoughtflow::application::clustering
