#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace faculty {

struct FacultyRecord {
    std::string faculty_id;                // rendered as string even when the input id is numeric
    std::string name;
    std::optional<std::string> department;
    std::optional<std::string> keywords;   // free text, e.g. "machine learning; data mining"
    std::optional<std::string> title;
    std::optional<std::string> school;
    std::vector<double> embedding;         // empty when the request carries no vectors

    const std::string& department_or_unknown() const;
    bool has_keywords() const { return keywords.has_value() && !keywords->empty(); }
};

struct SimilarityResult {
    FacultyRecord faculty;
    double similarity = 0.0;  // [-1, 1]
};

inline constexpr int kNoiseLabel = -1;

struct ClusterAssignment {
    FacultyRecord faculty;
    int cluster_id = kNoiseLabel;
    double membership_probability = 0.0;  // [0, 1]
};

struct ClusterSummary {
    int cluster_id = 0;
    std::vector<ClusterAssignment> members;

    size_t size() const { return members.size(); }
};

struct ClusteringReport {
    std::vector<ClusterSummary> clusters;  // largest first
    size_t outliers = 0;
    size_t total_clusters = 0;
    double silhouette_score = -1.0;        // -1 when fewer than two labels
    std::string algorithm;                 // "density" | "partition"
};

struct FacultyRef {
    std::string faculty_id;
    std::string name;
    std::string department;
};

struct TopicRecord {
    size_t topic_id = 0;
    std::string keyword;
    size_t frequency = 0;
    size_t faculty_count = 0;                  // uncapped
    std::vector<FacultyRef> associated_faculty; // first 10 matches
};

struct TopicsReport {
    std::vector<TopicRecord> topics;
    size_t total_keywords = 0;   // token occurrences before stop-word filtering
    size_t unique_keywords = 0;  // distinct tokens before stop-word filtering
    size_t coverage = 0;         // records with non-empty keyword text
};

}  // namespace faculty
