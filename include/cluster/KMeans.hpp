#pragma once
#include "cluster/Primitives.hpp"
#include <cstdint>

namespace cluster {

struct KMeansParams {
    uint32_t seed = 42;
    int n_init = 10;     // restarts; lowest inertia wins
    int max_iter = 300;
    double tol = 1e-4;   // relative to mean per-feature variance
};

// k-means++ seeding + Lloyd iterations. Fixed seed gives reproducible labels.
class KMeansClusterer final : public PartitionClusterer {
public:
    explicit KMeansClusterer(KMeansParams params = {}) : m_params(params) {}

    std::vector<int> fit(const Matrix& x, int k) const override;

private:
    KMeansParams m_params;
};

}  // namespace cluster
