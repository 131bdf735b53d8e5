#include "cluster/Dbscan.hpp"
#include "faculty/Errors.hpp"
#include <deque>
#include <string>

namespace cluster {

static std::vector<std::vector<Eigen::Index>> eps_neighborhoods(const Matrix& x, double eps) {
    const Eigen::Index n = x.rows();
    const double eps2 = eps * eps;

    std::vector<std::vector<Eigen::Index>> nb((size_t)n);
    for (Eigen::Index i = 0; i < n; ++i) {
        nb[(size_t)i].push_back(i);
        for (Eigen::Index j = i + 1; j < n; ++j) {
            if ((x.row(i) - x.row(j)).squaredNorm() <= eps2) {
                nb[(size_t)i].push_back(j);
                nb[(size_t)j].push_back(i);
            }
        }
    }
    return nb;
}

DensityResult DbscanClusterer::fit(const Matrix& x, int min_cluster_size) const {
    if (min_cluster_size < 1) {
        throw faculty::ClusteringError("DBSCAN min_samples must be >= 1, got " + std::to_string(min_cluster_size));
    }
    if (!(m_eps > 0.0)) {
        throw faculty::ClusteringError("DBSCAN eps must be > 0");
    }
    if (!x.allFinite()) {
        throw faculty::ClusteringError("DBSCAN input contains non-finite values");
    }

    const size_t n = (size_t)x.rows();
    const size_t min_samples = (size_t)min_cluster_size;

    auto nb = eps_neighborhoods(x, m_eps);

    std::vector<bool> core(n, false);
    for (size_t i = 0; i < n; ++i) core[i] = nb[i].size() >= min_samples;

    DensityResult r;
    r.labels.assign(n, -1);
    std::vector<double> prob(n, 0.0);

    int next_label = 0;
    for (size_t seed = 0; seed < n; ++seed) {
        if (!core[seed] || r.labels[seed] != -1) continue;

        const int label = next_label++;
        std::deque<size_t> frontier{seed};
        r.labels[seed] = label;

        while (!frontier.empty()) {
            size_t p = frontier.front();
            frontier.pop_front();
            if (!core[p]) continue;  // border points do not expand

            for (Eigen::Index qi : nb[p]) {
                size_t q = (size_t)qi;
                if (r.labels[q] != -1) continue;
                r.labels[q] = label;
                frontier.push_back(q);
            }
        }
    }

    for (size_t i = 0; i < n; ++i) {
        if (r.labels[i] == -1) continue;
        prob[i] = core[i] ? 1.0 : (double)nb[i].size() / (double)min_samples;
    }

    r.probabilities = std::move(prob);
    return r;
}

}  // namespace cluster
