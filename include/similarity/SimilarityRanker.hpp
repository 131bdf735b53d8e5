#pragma once
#include "faculty/Models.hpp"
#include "similarity/CosineBackend.hpp"
#include <vector>

namespace similarity {

class SimilarityRanker {
public:
    explicit SimilarityRanker(const CosineBackend& backend) : m_backend(backend) {}

    // clamped to [-1, 1]; throws faculty::InputValidationError on length mismatch
    double similarity(const std::vector<double>& a, const std::vector<double>& b) const;

    // candidates[i].embedding is scored against query; keeps score >= threshold,
    // stable-sorted descending, truncated to top_k
    std::vector<faculty::SimilarityResult> rank(
        const std::vector<double>& query,
        const std::vector<faculty::FacultyRecord>& candidates,
        size_t top_k,
        double threshold
    ) const;

    // n x n pairwise cosine matrix, symmetric with 1.0 on the diagonal for non-zero rows
    std::vector<std::vector<double>> similarity_matrix(const std::vector<std::vector<double>>& vectors) const;

private:
    const CosineBackend& m_backend;
};

}  // namespace similarity
