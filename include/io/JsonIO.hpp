#pragma once
#include "faculty/Models.hpp"
#include <iosfwd>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// Request parsing (validated once, throws faculty::InputValidationError)
// and report serialization.
namespace io {

using json = nlohmann::json;

json read_json(std::istream& in);

faculty::FacultyRecord parse_faculty(const json& j, const std::string& where);

// missing key -> empty list when optional, error otherwise
std::vector<faculty::FacultyRecord> parse_faculty_list(const json& root, const char* key, bool required);

std::vector<double> parse_vector(const json& j, const std::string& where);

// every row must have the same length
std::vector<std::vector<double>> parse_vectors(const json& root, const char* key);

std::vector<std::string> parse_texts(const json& root, const char* key);

size_t get_count(const json& root, const char* key, size_t def);
double get_number(const json& root, const char* key, double def);

// records[i].embedding = vectors[i]; lengths must match
void attach_embeddings(std::vector<faculty::FacultyRecord>& records, std::vector<std::vector<double>> vectors);

json to_json(const faculty::FacultyRecord& r);
json to_json(const faculty::SimilarityResult& r);
json to_json(const faculty::ClusteringReport& r);
json to_json(const faculty::TopicsReport& r);

}  // namespace io
