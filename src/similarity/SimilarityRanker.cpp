#include "similarity/SimilarityRanker.hpp"
#include "faculty/Errors.hpp"
#include <algorithm>
#include <string>

namespace similarity {

double SimilarityRanker::similarity(const std::vector<double>& a, const std::vector<double>& b) const {
    if (a.size() != b.size()) {
        throw faculty::InputValidationError(
            "embedding dimension mismatch: " + std::to_string(a.size()) + " vs " + std::to_string(b.size()));
    }
    double s = m_backend.cosine(a.data(), b.data(), a.size());
    return std::clamp(s, -1.0, 1.0);
}

std::vector<faculty::SimilarityResult> SimilarityRanker::rank(
    const std::vector<double>& query,
    const std::vector<faculty::FacultyRecord>& candidates,
    size_t top_k,
    double threshold
) const {
    std::vector<faculty::SimilarityResult> hits;
    hits.reserve(candidates.size());

    for (const auto& c : candidates) {
        double s = similarity(query, c.embedding);
        if (s >= threshold) hits.push_back({c, s});
    }

    // stable: equal scores keep input order
    std::stable_sort(hits.begin(), hits.end(), [](const auto& a, const auto& b){
        return a.similarity > b.similarity;
    });

    if (hits.size() > top_k) hits.resize(top_k);
    return hits;
}

std::vector<std::vector<double>> SimilarityRanker::similarity_matrix(
    const std::vector<std::vector<double>>& vectors
) const {
    const size_t n = vectors.size();
    std::vector<std::vector<double>> m(n, std::vector<double>(n, 0.0));

    for (size_t i = 0; i < n; ++i) {
        for (size_t j = i; j < n; ++j) {
            double s = similarity(vectors[i], vectors[j]);
            m[i][j] = s;
            m[j][i] = s;
        }
    }
    return m;
}

}  // namespace similarity
