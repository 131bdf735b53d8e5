#pragma once
#include "cluster/Primitives.hpp"

namespace cluster {

// Projects centered rows onto the leading right singular vectors.
// Output width is min(target_dim, cols, rows).
class PcaReducer final : public DimensionalityReducer {
public:
    Matrix reduce(const Matrix& x, int target_dim) const override;
};

}  // namespace cluster
