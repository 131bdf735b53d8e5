#include <gtest/gtest.h>
#include "commands/Commands.hpp"
#include "faculty/Errors.hpp"

#include <memory>
#include <sstream>

using nlohmann::json;

namespace {

// deterministic 3-d vectors; remembers the texts it was given
class FakeEmbedder : public emb::TextEmbedder {
public:
    explicit FakeEmbedder(std::shared_ptr<std::vector<std::string>> seen) : m_seen(std::move(seen)) {}

    std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts) const override {
        std::vector<std::vector<float>> out;
        for (const auto& t : texts) {
            m_seen->push_back(t);
            out.push_back({(float)t.size(), 1.0f, 0.0f});
        }
        return out;
    }
    size_t dim() const override { return 3; }

private:
    std::shared_ptr<std::vector<std::string>> m_seen;
};

struct CommandsTest : ::testing::Test {
    std::shared_ptr<std::vector<std::string>> seen = std::make_shared<std::vector<std::string>>();
    int created = 0;

    std::unique_ptr<Service> make_service() {
        return std::make_unique<Service>(AppConfig{}, [this]() -> std::unique_ptr<emb::TextEmbedder> {
            ++created;
            return std::make_unique<FakeEmbedder>(seen);
        });
    }
};

json faculty_rows(size_t n) {
    json rows = json::array();
    for (size_t i = 0; i < n; ++i) {
        rows.push_back({{"faculty_id", "f" + std::to_string(i)}, {"name", "Prof " + std::to_string(i)}});
    }
    return rows;
}

}  // namespace

TEST_F(CommandsTest, UnknownCommandIsAFailureObject) {
    auto svc = make_service();
    std::istringstream in("{}");
    json out = run_command("frobnicate", *svc, in);
    EXPECT_EQ(out["success"], false);
    EXPECT_EQ(out["error"], "Unknown command: frobnicate");
    EXPECT_FALSE(is_known_command("frobnicate"));
    EXPECT_TRUE(is_known_command("similarity_matrix"));
}

TEST_F(CommandsTest, TestCommandLoadsModelWithoutReadingInput) {
    auto svc = make_service();
    std::istringstream in("this is not json");
    json out = run_command("test", *svc, in);
    EXPECT_EQ(out["success"], true);
    EXPECT_EQ(out["message"], "All dependencies loaded successfully");
    EXPECT_EQ(created, 1);
}

TEST_F(CommandsTest, TestCommandReportsModelFailure) {
    Service svc(AppConfig{}, []() -> std::unique_ptr<emb::TextEmbedder> {
        throw faculty::ModelInitializationError("vocab missing");
    });
    json out = cmd_test(svc);
    EXPECT_EQ(out["success"], false);
    EXPECT_EQ(out["error"], "Failed to initialize model: vocab missing");
}

TEST_F(CommandsTest, GenerateEmbeddingsCleansTextFirst) {
    auto svc = make_service();
    json out = cmd_generate_embeddings(*svc, {{"texts", json::array({"  robotics;\n vision ", nullptr})}});

    ASSERT_EQ(out["success"], true);
    ASSERT_EQ(out["embeddings"].size(), 2u);
    EXPECT_EQ(out["embeddings"][0].size(), 3u);
    ASSERT_EQ(seen->size(), 2u);
    EXPECT_EQ((*seen)[0], "robotics, vision");
    EXPECT_EQ((*seen)[1], "");
}

TEST_F(CommandsTest, GenerateEmbeddingsOnEmptyInput) {
    auto svc = make_service();
    json out = cmd_generate_embeddings(*svc, {{"texts", json::array()}});
    EXPECT_EQ(out["success"], true);
    EXPECT_TRUE(out["embeddings"].empty());
}

TEST_F(CommandsTest, ModelIsLoadedOncePerService) {
    auto svc = make_service();
    cmd_test(*svc);
    cmd_generate_embeddings(*svc, {{"texts", json::array({"a"})}});
    EXPECT_EQ(created, 1);
}

TEST_F(CommandsTest, FindSimilarFiltersAndRanks) {
    auto svc = make_service();
    json req = {
        {"target_embedding", {1, 0, 0}},
        {"all_embeddings", {{1, 0, 0}, {1, 0, 0}, {0, 1, 0}}},
        {"faculty_data", faculty_rows(3)},
        {"top_k", 2},
        {"threshold", 0.1}
    };
    json out = cmd_find_similar(*svc, req);

    ASSERT_EQ(out["success"], true);
    const json& hits = out["similar_faculty"];
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits[0]["faculty_id"], "f0");
    EXPECT_EQ(hits[1]["faculty_id"], "f1");
    EXPECT_NEAR(hits[0]["similarity"].get<double>(), 1.0, 1e-9);
    // the model is not needed for ranking
    EXPECT_EQ(created, 0);
}

TEST_F(CommandsTest, FindSimilarOnEmptyCandidates) {
    auto svc = make_service();
    json req = {
        {"target_embedding", {1, 0}},
        {"all_embeddings", json::array()},
        {"faculty_data", json::array()}
    };
    json out = cmd_find_similar(*svc, req);
    EXPECT_EQ(out["success"], true);
    EXPECT_TRUE(out["similar_faculty"].empty());
}

TEST_F(CommandsTest, FindSimilarRejectsMismatchedLengths) {
    auto svc = make_service();
    json req = {
        {"target_embedding", {1, 0}},
        {"all_embeddings", json::array({json::array({1, 0})})},
        {"faculty_data", faculty_rows(2)}
    };
    json out = cmd_find_similar(*svc, req);
    EXPECT_EQ(out["success"], false);
    EXPECT_TRUE(out["error"].is_string());

    json missing = {{"faculty_data", faculty_rows(1)}, {"all_embeddings", json::array({json::array({1, 0})})}};
    EXPECT_EQ(cmd_find_similar(*svc, missing)["success"], false);
}

TEST_F(CommandsTest, ClusterFailsWithTooFewRecords) {
    auto svc = make_service();
    json req = {
        {"embeddings", {{1, 0}, {0, 1}}},
        {"faculty_data", faculty_rows(2)},
        {"min_cluster_size", 3}
    };
    json out = cmd_cluster_faculty(*svc, req);
    EXPECT_EQ(out["success"], false);

    json empty = {{"embeddings", json::array()}, {"faculty_data", json::array()}};
    EXPECT_EQ(cmd_cluster_faculty(*svc, empty)["success"], false);
}

TEST_F(CommandsTest, ClusterReportCoversEveryRecord) {
    auto svc = make_service();
    json embeddings = json::array();
    for (int i = 0; i < 12; ++i) {
        const double base = (i < 6) ? 0.0 : 10.0;
        embeddings.push_back({base + 0.01 * i, base - 0.02 * i, 1.0 + 0.03 * (i % 3)});
    }
    json req = {{"embeddings", embeddings}, {"faculty_data", faculty_rows(12)}};
    json out = cmd_cluster_faculty(*svc, req);

    ASSERT_EQ(out["success"], true) << out.dump();
    const json& c = out["clustering"];
    size_t total = c["outliers"].get<size_t>();
    for (const auto& cl : c["clusters"]) total += cl["size"].get<size_t>();
    EXPECT_EQ(total, 12u);
    EXPECT_EQ(c["total_clusters"].get<size_t>(), c["clusters"].size());
    const std::string algo = c["algorithm_used"];
    EXPECT_TRUE(algo == "density" || algo == "partition");
}

TEST_F(CommandsTest, ClusterRejectsZeroMinClusterSize) {
    auto svc = make_service();
    json req = {
        {"embeddings", {{1, 0}, {0, 1}, {1, 1}}},
        {"faculty_data", faculty_rows(3)},
        {"min_cluster_size", 0}
    };
    EXPECT_EQ(cmd_cluster_faculty(*svc, req)["success"], false);
}

TEST_F(CommandsTest, AnalyzeTopics) {
    auto svc = make_service();
    json req = {{"faculty_data", {
        {{"faculty_id", "1"}, {"name", "A"}, {"keywords", "machine learning, data mining"}},
        {{"faculty_id", "2"}, {"name", "B"}, {"keywords", "deep learning"}, {"department", "EE"}}
    }}};
    json out = cmd_analyze_topics(*svc, req);

    ASSERT_EQ(out["success"], true);
    const json& t = out["topics"];
    EXPECT_EQ(t["total_keywords"], 6);
    EXPECT_EQ(t["unique_keywords"], 5);
    EXPECT_EQ(t["coverage"], 2);
    EXPECT_EQ(t["topics"][0]["keyword"], "learning");
    EXPECT_EQ(t["topics"][0]["faculty_count"], 2);
    EXPECT_EQ(t["topics"][0]["associated_faculty"][0]["department"], "Unknown");
}

TEST_F(CommandsTest, AnalyzeTopicsOnEmptyInput) {
    auto svc = make_service();
    json out = cmd_analyze_topics(*svc, {{"faculty_data", json::array()}});
    EXPECT_EQ(out["success"], true);
    EXPECT_TRUE(out["topics"]["topics"].empty());
    EXPECT_EQ(out["topics"]["coverage"], 0);
}

TEST_F(CommandsTest, SimilarityMatrix) {
    auto svc = make_service();
    json out = cmd_similarity_matrix(*svc, {{"embeddings", {{1, 0}, {0, 1}}}});
    ASSERT_EQ(out["success"], true);
    const json& m = out["similarity_matrix"];
    ASSERT_EQ(m.size(), 2u);
    EXPECT_NEAR(m[0][0].get<double>(), 1.0, 1e-9);
    EXPECT_NEAR(m[0][1].get<double>(), 0.0, 1e-9);
}

TEST_F(CommandsTest, RunCommandRejectsUnparsableInput) {
    auto svc = make_service();
    std::istringstream in("[1, 2");
    EXPECT_THROW(run_command("find_similar", *svc, in), faculty::InputValidationError);
}

TEST_F(CommandsTest, RunCommandDispatches) {
    auto svc = make_service();
    std::istringstream in(R"({"embeddings": [[1, 0], [1, 0]]})");
    json out = run_command("similarity_matrix", *svc, in);
    ASSERT_EQ(out["success"], true);
    EXPECT_NEAR(out["similarity_matrix"][0][1].get<double>(), 1.0, 1e-9);
}
