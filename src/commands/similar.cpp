#include "commands/Commands.hpp"
#include "faculty/Errors.hpp"
#include "io/JsonIO.hpp"
#include "logging/Log.hpp"

using json = nlohmann::json;

json cmd_find_similar(Service& svc, const json& in) {
    try {
        if (!in.is_object() || !in.contains("target_embedding")) {
            throw faculty::InputValidationError("root missing required field: target_embedding");
        }
        const std::vector<double> target = io::parse_vector(in.at("target_embedding"), "root.target_embedding");

        auto records = io::parse_faculty_list(in, "faculty_data", true);
        io::attach_embeddings(records, io::parse_vectors(in, "all_embeddings"));

        const size_t top_k     = io::get_count(in, "top_k", 10);
        const double threshold = io::get_number(in, "threshold", 0.1);

        auto hits = svc.ranker().rank(target, records, top_k, threshold);

        json out = json::array();
        for (const auto& h : hits) out.push_back(io::to_json(h));

        logging::info("find_similar", std::to_string(hits.size()) + " of " + std::to_string(records.size()) +
                      " candidates kept (threshold=" + std::to_string(threshold) + ")");
        return {{"success", true}, {"similar_faculty", std::move(out)}};
    } catch (const std::exception& e) {
        return failure("find_similar", e);
    }
}

json cmd_similarity_matrix(Service& svc, const json& in) {
    try {
        const auto vecs = io::parse_vectors(in, "embeddings");
        return {{"success", true}, {"similarity_matrix", svc.ranker().similarity_matrix(vecs)}};
    } catch (const std::exception& e) {
        return failure("similarity_matrix", e);
    }
}
