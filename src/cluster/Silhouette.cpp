#include "cluster/Silhouette.hpp"
#include "faculty/Errors.hpp"
#include <algorithm>
#include <limits>
#include <map>
#include <string>

namespace cluster {

double EuclideanSilhouette::score(const Matrix& x, const std::vector<int>& labels) const {
    const size_t n = (size_t)x.rows();
    if (labels.size() != n) {
        throw faculty::ClusteringError("silhouette: " + std::to_string(labels.size()) +
                                       " labels for " + std::to_string(n) + " samples");
    }

    // label -> dense group index
    std::map<int, size_t> group_of;
    for (int l : labels) group_of.emplace(l, 0);
    const size_t g = group_of.size();
    if (g < 2 || g > n - 1) {
        throw faculty::ClusteringError("silhouette needs 2 <= n_labels <= n_samples - 1, got n_labels=" +
                                       std::to_string(g) + ", n_samples=" + std::to_string(n));
    }
    size_t idx = 0;
    for (auto& kv : group_of) kv.second = idx++;

    std::vector<size_t> group(n);
    std::vector<size_t> group_size(g, 0);
    for (size_t i = 0; i < n; ++i) {
        group[i] = group_of[labels[i]];
        group_size[group[i]] += 1;
    }

    double total = 0.0;
    std::vector<double> dist_sum(g);

    for (size_t i = 0; i < n; ++i) {
        std::fill(dist_sum.begin(), dist_sum.end(), 0.0);
        for (size_t j = 0; j < n; ++j) {
            if (j == i) continue;
            dist_sum[group[j]] += (x.row((Eigen::Index)i) - x.row((Eigen::Index)j)).norm();
        }

        const size_t own = group[i];
        if (group_size[own] <= 1) continue;  // s(i) = 0

        const double a = dist_sum[own] / (double)(group_size[own] - 1);
        double b = std::numeric_limits<double>::infinity();
        for (size_t c = 0; c < g; ++c) {
            if (c == own) continue;
            b = std::min(b, dist_sum[c] / (double)group_size[c]);
        }

        const double denom = std::max(a, b);
        if (denom > 0.0) total += (b - a) / denom;
    }

    return total / (double)n;
}

}  // namespace cluster
