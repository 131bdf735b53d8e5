#include "io/JsonIO.hpp"
#include "faculty/Errors.hpp"

#include <cmath>
#include <istream>
#include <sstream>

namespace io {

using faculty::InputValidationError;

json read_json(std::istream& in) {
    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw InputValidationError(std::string("failed to parse JSON input: ") + e.what());
    }
    return j;
}

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw InputValidationError(where + " must be an object");
    }
}

static std::string require_id(const json& j, const std::string& where) {
    const char* key = j.contains("faculty_id") ? "faculty_id" : "id";
    if (!j.contains(key)) {
        throw InputValidationError(where + " missing required field: faculty_id");
    }
    const json& v = j.at(key);
    if (v.is_string()) return v.get<std::string>();
    if (v.is_number_integer()) return v.dump();
    throw InputValidationError(where + "." + key + " must be a string or integer");
}

static std::string require_string(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw InputValidationError(where + " missing required field: " + std::string(key));
    }
    if (!j.at(key).is_string()) {
        throw InputValidationError(where + "." + std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

// absent or null -> nullopt
static std::optional<std::string> optional_string(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    if (!j.at(key).is_string()) {
        throw InputValidationError(where + "." + std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

faculty::FacultyRecord parse_faculty(const json& j, const std::string& where) {
    require_object(j, where);

    faculty::FacultyRecord r;
    r.faculty_id = require_id(j, where);
    r.name       = require_string(j, "name", where);
    r.department = optional_string(j, "department", where);
    r.keywords   = optional_string(j, "keywords", where);
    r.title      = optional_string(j, "title", where);
    r.school     = optional_string(j, "school", where);
    return r;
}

std::vector<faculty::FacultyRecord> parse_faculty_list(const json& root, const char* key, bool required) {
    require_object(root, "root");
    if (!root.contains(key) || root.at(key).is_null()) {
        if (required) throw InputValidationError("root missing required field: " + std::string(key));
        return {};
    }
    const json& arr = root.at(key);
    if (!arr.is_array()) {
        throw InputValidationError("root." + std::string(key) + " must be an array");
    }

    std::vector<faculty::FacultyRecord> out;
    out.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        std::ostringstream oss;
        oss << "root." << key << "[" << i << "]";
        out.push_back(parse_faculty(arr.at(i), oss.str()));
    }
    return out;
}

std::vector<double> parse_vector(const json& j, const std::string& where) {
    if (!j.is_array()) {
        throw InputValidationError(where + " must be an array of numbers");
    }
    std::vector<double> v;
    v.reserve(j.size());
    for (size_t i = 0; i < j.size(); ++i) {
        const json& x = j.at(i);
        if (!x.is_number()) {
            std::ostringstream oss;
            oss << where << "[" << i << "] must be a number";
            throw InputValidationError(oss.str());
        }
        double d = x.get<double>();
        if (!std::isfinite(d)) {
            std::ostringstream oss;
            oss << where << "[" << i << "] must be finite";
            throw InputValidationError(oss.str());
        }
        v.push_back(d);
    }
    return v;
}

std::vector<std::vector<double>> parse_vectors(const json& root, const char* key) {
    require_object(root, "root");
    if (!root.contains(key) || root.at(key).is_null()) {
        throw InputValidationError("root missing required field: " + std::string(key));
    }
    const json& arr = root.at(key);
    if (!arr.is_array()) {
        throw InputValidationError("root." + std::string(key) + " must be an array");
    }

    std::vector<std::vector<double>> out;
    out.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        std::ostringstream oss;
        oss << "root." << key << "[" << i << "]";
        out.push_back(parse_vector(arr.at(i), oss.str()));

        if (out.back().size() != out.front().size()) {
            throw InputValidationError(oss.str() + " has dimension " + std::to_string(out.back().size()) +
                                       ", expected " + std::to_string(out.front().size()));
        }
    }
    return out;
}

std::vector<std::string> parse_texts(const json& root, const char* key) {
    require_object(root, "root");
    if (!root.contains(key) || root.at(key).is_null()) return {};

    const json& arr = root.at(key);
    if (!arr.is_array()) {
        throw InputValidationError("root." + std::string(key) + " must be an array");
    }
    std::vector<std::string> out;
    out.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        const json& t = arr.at(i);
        // null entries behave like empty text
        if (t.is_null()) {
            out.emplace_back();
        } else if (t.is_string()) {
            out.push_back(t.get<std::string>());
        } else {
            std::ostringstream oss;
            oss << "root." << key << "[" << i << "] must be a string";
            throw InputValidationError(oss.str());
        }
    }
    return out;
}

size_t get_count(const json& root, const char* key, size_t def) {
    require_object(root, "root");
    if (!root.contains(key) || root.at(key).is_null()) return def;
    const json& v = root.at(key);
    if (!v.is_number_integer() || v.get<long long>() < 0) {
        throw InputValidationError("root." + std::string(key) + " must be a non-negative integer");
    }
    return (size_t)v.get<long long>();
}

double get_number(const json& root, const char* key, double def) {
    require_object(root, "root");
    if (!root.contains(key) || root.at(key).is_null()) return def;
    const json& v = root.at(key);
    if (!v.is_number()) {
        throw InputValidationError("root." + std::string(key) + " must be a number");
    }
    return v.get<double>();
}

void attach_embeddings(std::vector<faculty::FacultyRecord>& records, std::vector<std::vector<double>> vectors) {
    if (records.size() != vectors.size()) {
        throw InputValidationError("got " + std::to_string(vectors.size()) + " embeddings for " +
                                   std::to_string(records.size()) + " faculty records");
    }
    for (size_t i = 0; i < records.size(); ++i) records[i].embedding = std::move(vectors[i]);
}

json to_json(const faculty::FacultyRecord& r) {
    json j;
    j["faculty_id"] = r.faculty_id;
    j["name"] = r.name;
    if (r.department) j["department"] = *r.department;
    if (r.keywords) j["keywords"] = *r.keywords;
    if (r.title) j["title"] = *r.title;
    if (r.school) j["school"] = *r.school;
    return j;
}

json to_json(const faculty::SimilarityResult& r) {
    json j = to_json(r.faculty);
    j["similarity"] = r.similarity;
    return j;
}

json to_json(const faculty::ClusteringReport& r) {
    json clusters = json::array();
    for (const auto& c : r.clusters) {
        json members = json::array();
        for (const auto& m : c.members) {
            json mj = to_json(m.faculty);
            mj["cluster_id"] = m.cluster_id;
            mj["cluster_probability"] = m.membership_probability;
            members.push_back(std::move(mj));
        }
        clusters.push_back({
            {"cluster_id", c.cluster_id},
            {"size", c.size()},
            {"members", std::move(members)}
        });
    }

    return {
        {"clusters", std::move(clusters)},
        {"outliers", r.outliers},
        {"total_clusters", r.total_clusters},
        {"silhouette_score", r.silhouette_score},
        {"algorithm_used", r.algorithm}
    };
}

json to_json(const faculty::TopicsReport& r) {
    json topics = json::array();
    for (const auto& t : r.topics) {
        json assoc = json::array();
        for (const auto& f : t.associated_faculty) {
            assoc.push_back({{"faculty_id", f.faculty_id}, {"name", f.name}, {"department", f.department}});
        }
        topics.push_back({
            {"topic_id", t.topic_id},
            {"keyword", t.keyword},
            {"frequency", t.frequency},
            {"faculty_count", t.faculty_count},
            {"associated_faculty", std::move(assoc)}
        });
    }

    return {
        {"topics", std::move(topics)},
        {"total_keywords", r.total_keywords},
        {"unique_keywords", r.unique_keywords},
        {"coverage", r.coverage}
    };
}

}  // namespace io
