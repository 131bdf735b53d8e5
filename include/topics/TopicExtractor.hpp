#pragma once
#include "faculty/Models.hpp"
#include <string>
#include <unordered_set>
#include <vector>

namespace topics {

struct TopicExtractorConfig {
    size_t max_associated = 10;  // display cap; faculty_count stays uncapped
    size_t min_keyword_len = 4;  // shorter tokens are dropped after counting
};

class TopicExtractor {
public:
    TopicExtractor() = default;
    explicit TopicExtractor(TopicExtractorConfig cfg) : m_cfg(cfg) {}

    // throws faculty::TopicAnalysisError
    faculty::TopicsReport extract(const std::vector<faculty::FacultyRecord>& records, size_t num_topics) const;

    static const std::unordered_set<std::string>& stop_words();

private:
    TopicExtractorConfig m_cfg;
};

}  // namespace topics
