#include "commands/Commands.hpp"
#include "faculty/Errors.hpp"
#include "io/JsonIO.hpp"

#include <limits>

using json = nlohmann::json;

json cmd_cluster_faculty(Service& svc, const json& in) {
    try {
        auto records = io::parse_faculty_list(in, "faculty_data", true);
        io::attach_embeddings(records, io::parse_vectors(in, "embeddings"));

        const size_t min_cluster_size = io::get_count(in, "min_cluster_size", 3);
        if (min_cluster_size < 1) {
            throw faculty::InputValidationError("root.min_cluster_size must be >= 1");
        }
        if (min_cluster_size > (size_t)std::numeric_limits<int>::max()) {
            throw faculty::InputValidationError("root.min_cluster_size is too large");
        }

        const faculty::ClusteringReport rep = svc.clusters().cluster(records, (int)min_cluster_size);
        return {{"success", true}, {"clustering", io::to_json(rep)}};
    } catch (const std::exception& e) {
        return failure("cluster_faculty", e);
    }
}
