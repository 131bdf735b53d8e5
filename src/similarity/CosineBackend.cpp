#include "similarity/CosineBackend.hpp"
#include "faculty/Errors.hpp"
#include <algorithm>
#include <cmath>

#include <Eigen/Core>

namespace similarity {

static double scalar_cosine(const double* a, const double* b, size_t dim, double sa, double sb) {
    double dot = 0.0, na = 0.0, nb = 0.0;
    for (size_t i = 0; i < dim; ++i) {
        double x = a[i] / sa, y = b[i] / sb;
        dot += x * y;
        na += x * x;
        nb += y * y;
    }
    if (na == 0.0 || nb == 0.0) return 0.0;
    return dot / (std::sqrt(na) * std::sqrt(nb));
}

double ScalarCosineBackend::cosine(const double* a, const double* b, size_t dim) const {
    const double s = scalar_cosine(a, b, dim, 1.0, 1.0);
    if (std::isfinite(s) && s != 0.0) return s;

    // squared norms left the double range: retry on max-abs scaled copies
    double ma = 0.0, mb = 0.0;
    for (size_t i = 0; i < dim; ++i) {
        ma = std::max(ma, std::abs(a[i]));
        mb = std::max(mb, std::abs(b[i]));
    }
    if (ma == 0.0 || mb == 0.0) return 0.0;
    return scalar_cosine(a, b, dim, ma, mb);
}

static double eigen_cosine(const Eigen::VectorXd& x, const Eigen::VectorXd& y) {
    const double na = x.squaredNorm();
    const double nb = y.squaredNorm();
    if (na == 0.0 || nb == 0.0) return 0.0;
    return x.dot(y) / (std::sqrt(na) * std::sqrt(nb));
}

double EigenCosineBackend::cosine(const double* a, const double* b, size_t dim) const {
    if (dim == 0) return 0.0;
    Eigen::Map<const Eigen::VectorXd> va(a, (Eigen::Index)dim);
    Eigen::Map<const Eigen::VectorXd> vb(b, (Eigen::Index)dim);

    const double s = eigen_cosine(va, vb);
    if (std::isfinite(s) && s != 0.0) return s;

    const double ma = va.cwiseAbs().maxCoeff();
    const double mb = vb.cwiseAbs().maxCoeff();
    if (ma == 0.0 || mb == 0.0) return 0.0;
    return eigen_cosine(va / ma, vb / mb);
}

std::unique_ptr<CosineBackend> make_cosine_backend(const std::string& name) {
    if (name == "eigen") return std::make_unique<EigenCosineBackend>();
    if (name == "scalar") return std::make_unique<ScalarCosineBackend>();
    throw faculty::InputValidationError("unknown similarity backend: " + name + " (expected eigen|scalar)");
}

}  // namespace similarity
