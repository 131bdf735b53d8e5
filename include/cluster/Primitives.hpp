#pragma once
#include <optional>
#include <vector>

#include <Eigen/Core>

namespace cluster {

// one point per row
using Matrix = Eigen::MatrixXd;

struct DensityResult {
    std::vector<int> labels;                          // -1 = noise
    std::optional<std::vector<double>> probabilities; // per point, [0, 1]
};

// All primitives throw faculty::ClusteringError on invalid input.

class DimensionalityReducer {
public:
    virtual ~DimensionalityReducer() = default;
    virtual Matrix reduce(const Matrix& x, int target_dim) const = 0;
};

class DensityClusterer {
public:
    virtual ~DensityClusterer() = default;
    virtual DensityResult fit(const Matrix& x, int min_cluster_size) const = 0;
};

class PartitionClusterer {
public:
    virtual ~PartitionClusterer() = default;
    // labels in [0, k-1]
    virtual std::vector<int> fit(const Matrix& x, int k) const = 0;
};

class SilhouetteScorer {
public:
    virtual ~SilhouetteScorer() = default;
    virtual double score(const Matrix& x, const std::vector<int>& labels) const = 0;
};

}  // namespace cluster
