#pragma once
#include "cluster/Primitives.hpp"
#include "faculty/Models.hpp"
#include <vector>

namespace cluster {

// Density clustering first; when it finds fewer than two clusters the result
// is discarded and k-partitioning runs instead with k = clamp(n / 10, 3, 15).
//
// Density results keep the clusterer's probabilities (1.0 when it reports
// none). Partition results are hard: every point gets probability 1.0 and
// no point is noise.
class ClusterEngine {
public:
    static constexpr int kMaxReducedDim = 50;
    static constexpr int kMinDensityClusters = 2;
    static constexpr int kFallbackMinK = 3;
    static constexpr int kFallbackMaxK = 15;

    ClusterEngine(const DimensionalityReducer& reducer,
                  const DensityClusterer& density,
                  const PartitionClusterer& partition,
                  const SilhouetteScorer& scorer)
        : m_reducer(reducer), m_density(density), m_partition(partition), m_scorer(scorer) {}

    // records[i].embedding are the points. throws faculty::ClusteringError
    faculty::ClusteringReport cluster(const std::vector<faculty::FacultyRecord>& records,
                                      int min_cluster_size) const;

    static int fallback_cluster_count(size_t n);
    static int reduction_target(size_t n);

    // per column zero mean / unit population variance; constant columns are only centered
    static Matrix standardize(const Matrix& x);

private:
    const DimensionalityReducer& m_reducer;
    const DensityClusterer& m_density;
    const PartitionClusterer& m_partition;
    const SilhouetteScorer& m_scorer;

    faculty::ClusteringReport run(const std::vector<faculty::FacultyRecord>& records,
                                  int min_cluster_size) const;
};

}  // namespace cluster
