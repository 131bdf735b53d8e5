#include "commands/Commands.hpp"
#include "io/JsonIO.hpp"

using json = nlohmann::json;

json cmd_analyze_topics(Service& svc, const json& in) {
    try {
        const auto records = io::parse_faculty_list(in, "faculty_data", false);
        const size_t num_topics = io::get_count(in, "num_topics", 10);

        const faculty::TopicsReport rep = svc.topics().extract(records, num_topics);
        return {{"success", true}, {"topics", io::to_json(rep)}};
    } catch (const std::exception& e) {
        return failure("analyze_topics", e);
    }
}
