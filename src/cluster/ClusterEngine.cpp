#include "cluster/ClusterEngine.hpp"
#include "faculty/Errors.hpp"
#include "logging/Log.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <set>
#include <string>

namespace cluster {

int ClusterEngine::fallback_cluster_count(size_t n) {
    const long long k = (long long)(n / 10);
    return (int)std::min<long long>(std::max<long long>(k, kFallbackMinK), kFallbackMaxK);
}

int ClusterEngine::reduction_target(size_t n) {
    if (n == 0) return 0;
    return (int)std::min<size_t>((size_t)kMaxReducedDim, n - 1);
}

Matrix ClusterEngine::standardize(const Matrix& x) {
    if (x.rows() == 0) return x;

    const Eigen::RowVectorXd mean = x.colwise().mean();
    Matrix centered = x.rowwise() - mean;

    Eigen::RowVectorXd scale = (centered.colwise().squaredNorm() / (double)x.rows()).cwiseSqrt();
    for (Eigen::Index j = 0; j < scale.size(); ++j) {
        if (scale(j) == 0.0) scale(j) = 1.0;
    }
    return (centered.array().rowwise() / scale.array()).matrix();
}

static Matrix to_matrix(const std::vector<faculty::FacultyRecord>& records) {
    const size_t dim = records.front().embedding.size();
    if (dim == 0) throw faculty::ClusteringError("embeddings must not be empty");

    Matrix m((Eigen::Index)records.size(), (Eigen::Index)dim);
    for (size_t i = 0; i < records.size(); ++i) {
        const auto& e = records[i].embedding;
        if (e.size() != dim) {
            throw faculty::ClusteringError("embedding " + std::to_string(i) + " has dimension " +
                                           std::to_string(e.size()) + ", expected " + std::to_string(dim));
        }
        for (size_t j = 0; j < dim; ++j) m((Eigen::Index)i, (Eigen::Index)j) = e[j];
    }
    if (!m.allFinite()) throw faculty::ClusteringError("embeddings contain non-finite values");
    return m;
}

static size_t count_clusters(const std::vector<int>& labels) {
    std::set<int> s;
    for (int l : labels) if (l != faculty::kNoiseLabel) s.insert(l);
    return s.size();
}

// renumber non-noise labels to 0..k-1, keeping their relative order
static void compact_labels(std::vector<int>& labels) {
    std::map<int, int> remap;
    for (int l : labels) if (l != faculty::kNoiseLabel) remap.emplace(l, 0);
    int next = 0;
    for (auto& kv : remap) kv.second = next++;
    for (int& l : labels) if (l != faculty::kNoiseLabel) l = remap[l];
}

faculty::ClusteringReport ClusterEngine::cluster(const std::vector<faculty::FacultyRecord>& records,
                                                 int min_cluster_size) const {
    try {
        return run(records, min_cluster_size);
    } catch (const faculty::ClusteringError&) {
        throw;
    } catch (const std::exception& e) {
        throw faculty::ClusteringError(std::string("clustering primitive failed: ") + e.what());
    }
}

faculty::ClusteringReport ClusterEngine::run(const std::vector<faculty::FacultyRecord>& records,
                                             int min_cluster_size) const {
    const size_t n = records.size();
    if (min_cluster_size < 1) {
        throw faculty::ClusteringError("min_cluster_size must be >= 1");
    }
    if (n < (size_t)min_cluster_size) {
        throw faculty::ClusteringError("need at least " + std::to_string(min_cluster_size) +
                                       " records to cluster, got " + std::to_string(n));
    }

    const Matrix scaled = standardize(to_matrix(records));
    const Matrix reduced = m_reducer.reduce(scaled, reduction_target(n));
    if (reduced.rows() != (Eigen::Index)n) {
        throw faculty::ClusteringError("reducer returned " + std::to_string(reduced.rows()) + " rows for " +
                                       std::to_string(n) + " records");
    }

    DensityResult dens = m_density.fit(reduced, min_cluster_size);
    if (dens.labels.size() != n) {
        throw faculty::ClusteringError("density clusterer returned wrong label count");
    }
    for (int l : dens.labels) {
        if (l < faculty::kNoiseLabel) throw faculty::ClusteringError("density label out of range: " + std::to_string(l));
    }
    if (dens.probabilities && dens.probabilities->size() != n) {
        throw faculty::ClusteringError("density clusterer returned wrong probability count");
    }

    const size_t n_density = count_clusters(dens.labels);

    std::vector<int> labels;
    std::vector<double> prob;
    faculty::ClusteringReport report;

    if (n_density < (size_t)kMinDensityClusters) {
        const int k = fallback_cluster_count(n);
        logging::info("ClusterEngine", "density found " + std::to_string(n_density) +
                      " cluster(s); falling back to partition with k=" + std::to_string(k));

        labels = m_partition.fit(reduced, k);
        if (labels.size() != n) {
            throw faculty::ClusteringError("partition clusterer returned wrong label count");
        }
        for (int l : labels) {
            if (l < 0 || l >= k) throw faculty::ClusteringError("partition label out of range: " + std::to_string(l));
        }
        prob.assign(n, 1.0);
        report.algorithm = "partition";
    } else {
        labels = std::move(dens.labels);
        if (dens.probabilities) {
            prob = std::move(*dens.probabilities);
            for (double& p : prob) p = std::clamp(p, 0.0, 1.0);
        } else {
            prob.assign(n, 1.0);
        }
        report.algorithm = "density";
    }

    compact_labels(labels);

    std::set<int> distinct(labels.begin(), labels.end());
    report.silhouette_score = distinct.size() >= 2 ? m_scorer.score(reduced, labels) : -1.0;

    // group in order of first appearance, noise counted separately
    std::map<int, size_t> slot;
    for (size_t i = 0; i < n; ++i) {
        const int l = labels[i];
        if (l == faculty::kNoiseLabel) {
            report.outliers += 1;
            continue;
        }
        auto it = slot.find(l);
        if (it == slot.end()) {
            it = slot.emplace(l, report.clusters.size()).first;
            faculty::ClusterSummary s;
            s.cluster_id = l;
            report.clusters.push_back(std::move(s));
        }
        report.clusters[it->second].members.push_back({records[i], l, prob[i]});
    }

    std::stable_sort(report.clusters.begin(), report.clusters.end(), [](const auto& a, const auto& b){
        return a.size() > b.size();
    });
    report.total_clusters = report.clusters.size();

    logging::info("ClusterEngine", report.algorithm + ": " + std::to_string(report.total_clusters) +
                  " clusters, " + std::to_string(report.outliers) + " outliers");
    return report;
}

}  // namespace cluster
