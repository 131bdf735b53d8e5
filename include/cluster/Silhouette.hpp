#pragma once
#include "cluster/Primitives.hpp"

namespace cluster {

// Mean silhouette coefficient with Euclidean distances. Every distinct label
// (including -1) is its own group; singleton groups score 0.
// Requires 2 <= distinct labels <= n - 1.
class EuclideanSilhouette final : public SilhouetteScorer {
public:
    double score(const Matrix& x, const std::vector<int>& labels) const override;
};

}  // namespace cluster
