#include "cluster/Pca.hpp"
#include "faculty/Errors.hpp"
#include <algorithm>
#include <string>

#include <Eigen/SVD>

namespace cluster {

Matrix PcaReducer::reduce(const Matrix& x, int target_dim) const {
    if (target_dim < 1) {
        throw faculty::ClusteringError("PCA target dimension must be >= 1, got " + std::to_string(target_dim));
    }
    if (x.rows() == 0 || x.cols() == 0) {
        throw faculty::ClusteringError("PCA input is empty");
    }
    if (!x.allFinite()) {
        throw faculty::ClusteringError("PCA input contains non-finite values");
    }

    const Eigen::Index k = std::min<Eigen::Index>({(Eigen::Index)target_dim, x.cols(), x.rows()});

    Matrix centered = x.rowwise() - x.colwise().mean();

    Eigen::BDCSVD<Matrix> svd(centered, Eigen::ComputeThinV);
    Matrix components = svd.matrixV().leftCols(k);

    // deterministic sign: largest |loading| of each component is positive
    for (Eigen::Index j = 0; j < k; ++j) {
        Eigen::Index arg = 0;
        components.col(j).cwiseAbs().maxCoeff(&arg);
        if (components(arg, j) < 0.0) components.col(j) *= -1.0;
    }

    return centered * components;
}

}  // namespace cluster
