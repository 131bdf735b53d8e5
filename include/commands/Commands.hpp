#pragma once
#include "commands/Service.hpp"
#include <exception>
#include <iosfwd>
#include <string>

#include <nlohmann/json.hpp>

// Each handler returns exactly one result object and never throws:
// failures become {"success": false, "error": ...}.
nlohmann::json cmd_test(Service& svc);
nlohmann::json cmd_generate_embeddings(Service& svc, const nlohmann::json& in);
nlohmann::json cmd_find_similar(Service& svc, const nlohmann::json& in);
nlohmann::json cmd_cluster_faculty(Service& svc, const nlohmann::json& in);
nlohmann::json cmd_analyze_topics(Service& svc, const nlohmann::json& in);
nlohmann::json cmd_similarity_matrix(Service& svc, const nlohmann::json& in);

bool is_known_command(const std::string& name);

// Reads the request from `in` (except for `test`) and runs the handler.
// Unknown commands yield a failure object without reading input.
// Unparsable input throws faculty::InputValidationError.
nlohmann::json run_command(const std::string& name, Service& svc, std::istream& in);

nlohmann::json failure(const std::string& component, const std::string& message);
nlohmann::json failure(const std::string& component, const std::exception& e);
