#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>

#include "application/clustering/DimensionalityReducer.hpp"

using namespace thoughtflow;
using namespace thoughtflow::application::clustering;

int main() {
    std::cout << "[Test] Starting DimensionalityReducer Test..." << std::endl;

    domain::EmbeddingMatrix vectors = {
        {1.0f, 0.0f, 0.0f, 2.0f, 0.5f},
        {0.9f, 0.1f, 0.0f, 1.8f, 0.4f},
        {0.0f, 0.0f, 1.0f, 0.1f, 3.0f}
    };

    DimensionalityReducer reducer(50);
    assert(reducer.effectiveComponents(3, 5) == 3);
    assert(reducer.effectiveComponents(100, 768) == 50);
    assert(DimensionalityReducer(2).effectiveComponents(3, 5) == 2);

    auto reduced = reducer.reduce(vectors);
    assert(reduced.ok());
    const Eigen::MatrixXd& r = reduced.value();
    assert(r.rows() == 3);
    assert(r.cols() == 3);
    std::cout << "[PASS] Component cap." << std::endl;

    // Keeping every component preserves pairwise distances.
    for (std::size_t i = 0; i < vectors.size(); ++i) {
        for (std::size_t j = i + 1; j < vectors.size(); ++j) {
            double original = 0.0;
            for (std::size_t k = 0; k < vectors[i].size(); ++k) {
                const double d = static_cast<double>(vectors[i][k]) - vectors[j][k];
                original += d * d;
            }
            const double projected = (r.row(static_cast<Eigen::Index>(i)) - r.row(static_cast<Eigen::Index>(j))).squaredNorm();
            assert(std::abs(original - projected) < 1e-6);
        }
    }
    std::cout << "[PASS] Distances preserved at full rank." << std::endl;

    for (Eigen::Index c = 0; c < r.cols(); ++c) {
        Eigen::Index pivot = 0;
        r.col(c).cwiseAbs().maxCoeff(&pivot);
        assert(r(pivot, c) >= 0.0);
    }
    auto again = reducer.reduce(vectors);
    assert(again.ok());
    assert((again.value() - r).cwiseAbs().maxCoeff() == 0.0);
    std::cout << "[PASS] Deterministic signs." << std::endl;

    auto single = reducer.reduce({{1.0f, 2.0f}});
    assert(!single.ok());
    assert(single.error().kind == domain::ErrorKind::ClusteringDegenerate);

    auto nonFinite = reducer.reduce({{1.0f, std::numeric_limits<float>::quiet_NaN()}, {0.0f, 1.0f}});
    assert(!nonFinite.ok());
    assert(nonFinite.error().kind == domain::ErrorKind::ClusteringDegenerate);

    auto ragged = reducer.reduce({{1.0f, 2.0f}, {1.0f}});
    assert(!ragged.ok());
    assert(ragged.error().kind == domain::ErrorKind::InputError);
    std::cout << "[PASS] Degenerate input rejected." << std::endl;

    std::cout << "[PASS] DimensionalityReducer Test." << std::endl;
    return 0;
}
