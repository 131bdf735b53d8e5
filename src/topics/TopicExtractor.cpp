#include "topics/TopicExtractor.hpp"
#include "faculty/Errors.hpp"
#include "logging/Log.hpp"
#include "text/TextUtil.hpp"
#include <algorithm>
#include <unordered_map>

namespace topics {

const std::unordered_set<std::string>& TopicExtractor::stop_words() {
    static const std::unordered_set<std::string> words = {
        "and", "the", "for", "with", "from", "that", "this", "are", "was", "were",
        "been", "have", "has", "had", "will", "would", "could", "should", "may",
        "can",
        // too generic to name a research theme
        "research", "study", "analysis", "using", "based", "approach"
    };
    return words;
}

namespace {

struct TokenCount {
    std::string token;
    size_t count = 0;
};

}  // namespace

faculty::TopicsReport TopicExtractor::extract(const std::vector<faculty::FacultyRecord>& records,
                                              size_t num_topics) const {
    try {
        faculty::TopicsReport rep;

        // counts kept in first-seen order so ties rank deterministically
        std::vector<TokenCount> counts;
        std::unordered_map<std::string, size_t> slot;

        for (const auto& r : records) {
            if (!r.has_keywords()) continue;
            rep.coverage += 1;

            for (auto& tok : textutil::keyword_tokens(*r.keywords)) {
                rep.total_keywords += 1;
                auto it = slot.find(tok);
                if (it == slot.end()) {
                    slot.emplace(tok, counts.size());
                    counts.push_back({std::move(tok), 1});
                } else {
                    counts[it->second].count += 1;
                }
            }
        }
        rep.unique_keywords = counts.size();

        const auto& stop = stop_words();
        std::vector<TokenCount> kept;
        kept.reserve(counts.size());
        for (const auto& tc : counts) {
            if (tc.token.size() < m_cfg.min_keyword_len) continue;
            if (stop.find(tc.token) != stop.end()) continue;
            kept.push_back(tc);
        }

        std::stable_sort(kept.begin(), kept.end(), [](const auto& a, const auto& b){
            return a.count > b.count;
        });
        if (kept.size() > num_topics) kept.resize(num_topics);

        std::vector<std::string> lowered;
        lowered.reserve(records.size());
        for (const auto& r : records) lowered.push_back(textutil::to_lower_ascii(r.keywords.value_or("")));

        for (size_t i = 0; i < kept.size(); ++i) {
            faculty::TopicRecord t;
            t.topic_id = i;
            t.keyword = kept[i].token;
            t.frequency = kept[i].count;

            for (size_t r = 0; r < records.size(); ++r) {
                if (lowered[r].find(t.keyword) == std::string::npos) continue;
                t.faculty_count += 1;
                if (t.associated_faculty.size() < m_cfg.max_associated) {
                    t.associated_faculty.push_back({records[r].faculty_id, records[r].name,
                                                    records[r].department_or_unknown()});
                }
            }
            rep.topics.push_back(std::move(t));
        }

        logging::info("TopicExtractor", std::to_string(rep.topics.size()) + " topics from " +
                      std::to_string(rep.coverage) + " records with keywords");
        return rep;
    } catch (const faculty::TopicAnalysisError&) {
        throw;
    } catch (const std::exception& e) {
        throw faculty::TopicAnalysisError(std::string("topic analysis failed: ") + e.what());
    }
}

}  // namespace topics
