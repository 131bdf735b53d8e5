#pragma once
#include <cstddef>
#include <memory>
#include <string>

namespace similarity {

// cosine similarity of two dim-length vectors; 0 when either has zero magnitude.
// Finite inputs give a finite result even when the squared norms over- or underflow.
class CosineBackend {
public:
    virtual ~CosineBackend() = default;
    virtual double cosine(const double* a, const double* b, size_t dim) const = 0;
    virtual const char* name() const = 0;
};

// plain loop
class ScalarCosineBackend final : public CosineBackend {
public:
    double cosine(const double* a, const double* b, size_t dim) const override;
    const char* name() const override { return "scalar"; }
};

// Eigen::Map over the raw buffers
class EigenCosineBackend final : public CosineBackend {
public:
    double cosine(const double* a, const double* b, size_t dim) const override;
    const char* name() const override { return "eigen"; }
};

// "eigen" | "scalar"; throws faculty::InputValidationError otherwise
std::unique_ptr<CosineBackend> make_cosine_backend(const std::string& name);

}  // namespace similarity
