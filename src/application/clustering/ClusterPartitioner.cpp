/**
 * @file ClusterPartitioner.cpp
 * @brief Ward linkage with Lance-Williams distance updates.
 */

#include "application/clustering/ClusterPartitioner.hpp"

#include <limits>
#include <string>

namespace thoughtflow::application::clustering {

using domain::ErrorKind;
using domain::Result;

namespace {

constexpr double kIdenticalTolerance = 1e-12;

bool AllRowsIdentical(const Eigen::MatrixXd& points) {
    for (Eigen::Index i = 1; i < points.rows(); ++i) {
        if ((points.row(i) - points.row(0)).cwiseAbs().maxCoeff() > kIdenticalTolerance) {
            return false;
        }
    }
    return true;
}

} // namespace

Result<std::vector<int>> ClusterPartitioner::partition(const Eigen::MatrixXd& points, int k) const {
    const int n = static_cast<int>(points.rows());
    if (n < 2) {
        return Result<std::vector<int>>::Fail(ErrorKind::ClusteringDegenerate, "fewer than 2 samples");
    }
    if (k < 2 || k > n) {
        return Result<std::vector<int>>::Fail(ErrorKind::ClusteringDegenerate,
                                              "cannot split " + std::to_string(n) + " samples into " +
                                              std::to_string(k) + " groups");
    }
    if (!points.allFinite()) {
        return Result<std::vector<int>>::Fail(ErrorKind::ClusteringDegenerate, "non-finite coordinates");
    }
    if (AllRowsIdentical(points)) {
        return Result<std::vector<int>>::Fail(ErrorKind::ClusteringDegenerate, "all samples are identical");
    }

    // Ward's criterion on squared Euclidean distances.
    Eigen::MatrixXd dist(n, n);
    for (int i = 0; i < n; ++i) {
        dist(i, i) = 0.0;
        for (int j = i + 1; j < n; ++j) {
            const double d = (points.row(i) - points.row(j)).squaredNorm();
            dist(i, j) = d;
            dist(j, i) = d;
        }
    }

    std::vector<int> sizes(n, 1);
    std::vector<bool> active(n, true);
    std::vector<int> owner(n);
    for (int i = 0; i < n; ++i) owner[i] = i;

    int remaining = n;
    while (remaining > k) {
        int bestI = -1;
        int bestJ = -1;
        double best = std::numeric_limits<double>::infinity();
        for (int i = 0; i < n; ++i) {
            if (!active[i]) continue;
            for (int j = i + 1; j < n; ++j) {
                if (!active[j]) continue;
                if (dist(i, j) < best) {
                    best = dist(i, j);
                    bestI = i;
                    bestJ = j;
                }
            }
        }

        // Cluster j is folded into cluster i.
        const double ni = sizes[bestI];
        const double nj = sizes[bestJ];
        for (int m = 0; m < n; ++m) {
            if (!active[m] || m == bestI || m == bestJ) continue;
            const double nm = sizes[m];
            const double updated = ((ni + nm) * dist(bestI, m) + (nj + nm) * dist(bestJ, m) - nm * best) /
                                   (ni + nj + nm);
            dist(bestI, m) = updated;
            dist(m, bestI) = updated;
        }
        sizes[bestI] += sizes[bestJ];
        active[bestJ] = false;
        for (int s = 0; s < n; ++s) {
            if (owner[s] == bestJ) owner[s] = bestI;
        }
        --remaining;
    }

    // Scanning samples in order numbers groups by their smallest member.
    std::vector<int> labelOfCluster(n, -1);
    std::vector<int> labels(n);
    int nextLabel = 0;
    for (int s = 0; s < n; ++s) {
        int& label = labelOfCluster[owner[s]];
        if (label < 0) label = nextLabel++;
        labels[s] = label;
    }
    return labels;
}

} // namespace thoughtflow::application::clustering
