#include "commands/Commands.hpp"
#include "io/JsonIO.hpp"
#include "logging/Log.hpp"

#include <istream>

using json = nlohmann::json;

json failure(const std::string& component, const std::string& message) {
    logging::error(component, message);
    return {{"success", false}, {"error", message}};
}

json failure(const std::string& component, const std::exception& e) {
    return failure(component, std::string(e.what()));
}

bool is_known_command(const std::string& name) {
    return name == "test" ||
           name == "generate_embeddings" ||
           name == "find_similar" ||
           name == "cluster_faculty" ||
           name == "analyze_topics" ||
           name == "similarity_matrix";
}

json run_command(const std::string& name, Service& svc, std::istream& in) {
    if (!is_known_command(name)) {
        return failure("faculty-sim", "Unknown command: " + name);
    }
    if (name == "test") return cmd_test(svc);

    const json req = io::read_json(in);

    if (name == "generate_embeddings") return cmd_generate_embeddings(svc, req);
    if (name == "find_similar")        return cmd_find_similar(svc, req);
    if (name == "cluster_faculty")     return cmd_cluster_faculty(svc, req);
    if (name == "analyze_topics")      return cmd_analyze_topics(svc, req);
    return cmd_similarity_matrix(svc, req);
}
