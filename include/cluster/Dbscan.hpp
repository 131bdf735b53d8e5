#pragma once
#include "cluster/Primitives.hpp"

namespace cluster {

// Euclidean DBSCAN. min_cluster_size is used as min_samples (a point counts
// itself). Labels are numbered in order of discovery.
//
// Probabilities: core points 1.0, border points neighbors/min_samples,
// noise 0.0.
class DbscanClusterer final : public DensityClusterer {
public:
    explicit DbscanClusterer(double eps = 0.5) : m_eps(eps) {}

    DensityResult fit(const Matrix& x, int min_cluster_size) const override;

    double eps() const { return m_eps; }

private:
    double m_eps;
};

}  // namespace cluster
