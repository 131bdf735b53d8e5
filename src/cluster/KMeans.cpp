#include "cluster/KMeans.hpp"
#include "faculty/Errors.hpp"
#include <limits>
#include <random>
#include <string>

namespace cluster {

namespace {

struct Run {
    std::vector<int> labels;
    double inertia = std::numeric_limits<double>::infinity();
};

Matrix kmeans_plusplus(const Matrix& x, int k, std::mt19937_64& rng) {
    const Eigen::Index n = x.rows();
    std::uniform_int_distribution<Eigen::Index> uni(0, n - 1);
    std::uniform_real_distribution<double> unif(0.0, 1.0);

    Matrix centers(k, x.cols());
    centers.row(0) = x.row(uni(rng));

    Eigen::VectorXd min_d2 = (x.rowwise() - centers.row(0)).rowwise().squaredNorm();

    for (int c = 1; c < k; ++c) {
        const double total = min_d2.sum();
        Eigen::Index pick = 0;
        if (total <= 0.0) {
            // every point already sits on a center
            pick = uni(rng);
        } else {
            double r = unif(rng) * total;
            for (pick = 0; pick < n - 1; ++pick) {
                r -= min_d2(pick);
                if (r <= 0.0) break;
            }
        }
        centers.row(c) = x.row(pick);
        min_d2 = min_d2.cwiseMin((x.rowwise() - centers.row(c)).rowwise().squaredNorm());
    }
    return centers;
}

// returns inertia
double assign(const Matrix& x, const Matrix& centers, std::vector<int>& labels, Eigen::VectorXd& d2) {
    double inertia = 0.0;
    for (Eigen::Index i = 0; i < x.rows(); ++i) {
        Eigen::Index best = 0;
        d2(i) = (centers.rowwise() - x.row(i)).rowwise().squaredNorm().minCoeff(&best);
        labels[(size_t)i] = (int)best;
        inertia += d2(i);
    }
    return inertia;
}

Run lloyd(const Matrix& x, int k, const KMeansParams& p, double tol_abs, std::mt19937_64& rng) {
    const Eigen::Index n = x.rows();
    Matrix centers = kmeans_plusplus(x, k, rng);

    Run run;
    run.labels.assign((size_t)n, 0);
    Eigen::VectorXd d2(n);

    for (int it = 0; it < p.max_iter; ++it) {
        assign(x, centers, run.labels, d2);

        Matrix next = Matrix::Zero(k, x.cols());
        std::vector<int> counts((size_t)k, 0);
        for (Eigen::Index i = 0; i < n; ++i) {
            next.row(run.labels[(size_t)i]) += x.row(i);
            counts[(size_t)run.labels[(size_t)i]] += 1;
        }

        for (int c = 0; c < k; ++c) {
            if (counts[(size_t)c] > 0) {
                next.row(c) /= (double)counts[(size_t)c];
                continue;
            }
            // empty cluster: move it onto the point farthest from its center
            Eigen::Index far = 0;
            d2.maxCoeff(&far);
            next.row(c) = x.row(far);
            d2(far) = 0.0;
        }

        const double shift = (next - centers).squaredNorm();
        centers = std::move(next);
        if (shift <= tol_abs) break;
    }

    run.inertia = assign(x, centers, run.labels, d2);
    return run;
}

}  // namespace

std::vector<int> KMeansClusterer::fit(const Matrix& x, int k) const {
    if (k < 1) throw faculty::ClusteringError("k-means needs k >= 1, got " + std::to_string(k));
    if (x.rows() < k) {
        throw faculty::ClusteringError("k-means needs at least k samples: n=" +
                                       std::to_string(x.rows()) + ", k=" + std::to_string(k));
    }
    if (x.cols() == 0) throw faculty::ClusteringError("k-means input has zero columns");
    if (!x.allFinite()) throw faculty::ClusteringError("k-means input contains non-finite values");

    // tolerance scaled by the data spread
    const Matrix centered = x.rowwise() - x.colwise().mean();
    const double mean_var = centered.colwise().squaredNorm().sum() / (double)(x.rows() * x.cols());
    const double tol_abs = m_params.tol * mean_var;

    std::mt19937_64 rng(m_params.seed);

    Run best;
    const int n_init = m_params.n_init < 1 ? 1 : m_params.n_init;
    for (int r = 0; r < n_init; ++r) {
        Run run = lloyd(x, k, m_params, tol_abs, rng);
        if (run.inertia < best.inertia) best = std::move(run);
    }
    return best.labels;
}

}  // namespace cluster
