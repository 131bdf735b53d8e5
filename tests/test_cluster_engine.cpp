#include <gtest/gtest.h>
#include "cluster/ClusterEngine.hpp"
#include "cluster/Dbscan.hpp"
#include "cluster/KMeans.hpp"
#include "cluster/Pca.hpp"
#include "cluster/Silhouette.hpp"
#include "faculty/Errors.hpp"

#include <set>
#include <stdexcept>

using cluster::ClusterEngine;
using cluster::DensityResult;
using cluster::Matrix;
using faculty::FacultyRecord;

namespace {

// returns the input unchanged, records the requested width
struct IdentityReducer : cluster::DimensionalityReducer {
    mutable int last_target = -1;
    Matrix reduce(const Matrix& x, int target_dim) const override {
        last_target = target_dim;
        return x;
    }
};

struct ScriptedDensity : cluster::DensityClusterer {
    DensityResult result;
    DensityResult fit(const Matrix&, int) const override { return result; }
};

struct RecordingPartition : cluster::PartitionClusterer {
    mutable int last_k = -1;
    std::vector<int> fit(const Matrix& x, int k) const override {
        last_k = k;
        std::vector<int> labels((size_t)x.rows());
        for (size_t i = 0; i < labels.size(); ++i) labels[i] = (int)(i % (size_t)k);
        return labels;
    }
};

// puts every point in cluster 0
struct SinglePartition : cluster::PartitionClusterer {
    std::vector<int> fit(const Matrix& x, int) const override {
        return std::vector<int>((size_t)x.rows(), 0);
    }
};

struct FixedScorer : cluster::SilhouetteScorer {
    mutable int calls = 0;
    double score(const Matrix&, const std::vector<int>&) const override {
        ++calls;
        return 0.42;
    }
};

struct ThrowingScorer : cluster::SilhouetteScorer {
    double score(const Matrix&, const std::vector<int>&) const override {
        throw std::runtime_error("scorer exploded");
    }
};

std::vector<FacultyRecord> make_records(size_t n, size_t dim = 4) {
    std::vector<FacultyRecord> out;
    for (size_t i = 0; i < n; ++i) {
        FacultyRecord r;
        r.faculty_id = std::to_string(i);
        r.name = "Faculty " + std::to_string(i);
        for (size_t j = 0; j < dim; ++j) r.embedding.push_back((double)((i * 7 + j * 3) % 11));
        out.push_back(std::move(r));
    }
    return out;
}

size_t member_total(const faculty::ClusteringReport& rep) {
    size_t total = rep.outliers;
    for (const auto& c : rep.clusters) total += c.size();
    return total;
}

}  // namespace

TEST(ClusterEngineTest, FallbackHeuristic) {
    EXPECT_EQ(ClusterEngine::fallback_cluster_count(12), 3);
    EXPECT_EQ(ClusterEngine::fallback_cluster_count(5), 3);
    EXPECT_EQ(ClusterEngine::fallback_cluster_count(70), 7);
    EXPECT_EQ(ClusterEngine::fallback_cluster_count(1000), 15);
}

TEST(ClusterEngineTest, ReductionTarget) {
    EXPECT_EQ(ClusterEngine::reduction_target(12), 11);
    EXPECT_EQ(ClusterEngine::reduction_target(500), 50);
}

TEST(ClusterEngineTest, StandardizeGivesZeroMeanUnitVariance) {
    Matrix x(4, 3);
    x << 1, 5, 7,
         2, 5, 9,
         3, 5, 11,
         4, 5, 13;
    Matrix s = ClusterEngine::standardize(x);

    for (Eigen::Index j = 0; j < 3; ++j) EXPECT_NEAR(s.col(j).mean(), 0.0, 1e-12);
    EXPECT_NEAR(s.col(0).squaredNorm() / 4.0, 1.0, 1e-12);
    EXPECT_NEAR(s.col(2).squaredNorm() / 4.0, 1.0, 1e-12);
    // constant column stays finite
    EXPECT_TRUE(s.col(1).isZero());
}

TEST(ClusterEngineTest, FallsBackToPartitionWhenDensityFindsOneCluster) {
    IdentityReducer reducer;
    ScriptedDensity density;
    density.result.labels = std::vector<int>(12, 0);
    density.result.labels[3] = -1;
    density.result.labels[8] = -1;
    density.result.probabilities = std::vector<double>(12, 0.3);
    RecordingPartition partition;
    FixedScorer scorer;

    ClusterEngine engine(reducer, density, partition, scorer);
    auto rep = engine.cluster(make_records(12), 3);

    EXPECT_EQ(partition.last_k, 3);
    EXPECT_EQ(reducer.last_target, 11);
    EXPECT_EQ(rep.algorithm, "partition");
    EXPECT_EQ(rep.outliers, 0u);
    EXPECT_EQ(rep.total_clusters, 3u);
    EXPECT_DOUBLE_EQ(rep.silhouette_score, 0.42);
    EXPECT_EQ(member_total(rep), 12u);

    for (const auto& c : rep.clusters) {
        for (const auto& m : c.members) {
            EXPECT_NE(m.cluster_id, -1);
            EXPECT_DOUBLE_EQ(m.membership_probability, 1.0);
        }
    }
}

TEST(ClusterEngineTest, FallsBackWhenEverythingIsNoise) {
    IdentityReducer reducer;
    ScriptedDensity density;
    density.result.labels = std::vector<int>(5, -1);
    RecordingPartition partition;
    FixedScorer scorer;

    ClusterEngine engine(reducer, density, partition, scorer);
    auto rep = engine.cluster(make_records(5), 3);

    EXPECT_EQ(rep.algorithm, "partition");
    EXPECT_EQ(partition.last_k, 3);
    EXPECT_EQ(rep.outliers, 0u);
    EXPECT_EQ(member_total(rep), 5u);
}

TEST(ClusterEngineTest, KeepsDensityLabelsAndProbabilities) {
    IdentityReducer reducer;
    ScriptedDensity density;
    density.result.labels = {0, 0, 1, -1, 1, 1, 0};
    density.result.probabilities = std::vector<double>{0.9, 0.8, 1.0, 0.0, 0.7, 0.6, 1.0};
    RecordingPartition partition;
    FixedScorer scorer;

    ClusterEngine engine(reducer, density, partition, scorer);
    auto rep = engine.cluster(make_records(7), 3);

    EXPECT_EQ(rep.algorithm, "density");
    EXPECT_EQ(partition.last_k, -1);
    EXPECT_EQ(rep.outliers, 1u);
    EXPECT_EQ(rep.total_clusters, 2u);
    EXPECT_EQ(member_total(rep), 7u);

    // equal sizes keep first-appearance order
    ASSERT_EQ(rep.clusters.size(), 2u);
    EXPECT_EQ(rep.clusters[0].cluster_id, 0);
    EXPECT_EQ(rep.clusters[1].cluster_id, 1);
    EXPECT_EQ(rep.clusters[0].members[0].faculty.faculty_id, "0");
    EXPECT_DOUBLE_EQ(rep.clusters[0].members[0].membership_probability, 0.9);
    EXPECT_DOUBLE_EQ(rep.clusters[1].members[1].membership_probability, 0.7);
}

TEST(ClusterEngineTest, SortsClustersBySizeDescending) {
    IdentityReducer reducer;
    ScriptedDensity density;
    density.result.labels = {0, 1, 1, 1, 2, 2};
    RecordingPartition partition;
    FixedScorer scorer;

    ClusterEngine engine(reducer, density, partition, scorer);
    auto rep = engine.cluster(make_records(6), 1);

    ASSERT_EQ(rep.clusters.size(), 3u);
    EXPECT_EQ(rep.clusters[0].cluster_id, 1);
    EXPECT_EQ(rep.clusters[1].cluster_id, 2);
    EXPECT_EQ(rep.clusters[2].cluster_id, 0);
    // no native probabilities: hard membership
    for (const auto& c : rep.clusters)
        for (const auto& m : c.members) EXPECT_DOUBLE_EQ(m.membership_probability, 1.0);
}

TEST(ClusterEngineTest, CompactsSparseLabels) {
    IdentityReducer reducer;
    ScriptedDensity density;
    density.result.labels = {4, 4, 9, 9, -1};
    RecordingPartition partition;
    FixedScorer scorer;

    ClusterEngine engine(reducer, density, partition, scorer);
    auto rep = engine.cluster(make_records(5), 2);

    std::set<int> ids;
    for (const auto& c : rep.clusters) ids.insert(c.cluster_id);
    EXPECT_EQ(ids, (std::set<int>{0, 1}));
}

TEST(ClusterEngineTest, TooFewRecordsFails) {
    IdentityReducer reducer;
    ScriptedDensity density;
    RecordingPartition partition;
    FixedScorer scorer;

    ClusterEngine engine(reducer, density, partition, scorer);
    EXPECT_THROW(engine.cluster(make_records(2), 3), faculty::ClusteringError);
    EXPECT_THROW(engine.cluster({}, 3), faculty::ClusteringError);
}

TEST(ClusterEngineTest, MismatchedDimensionsFail) {
    IdentityReducer reducer;
    ScriptedDensity density;
    RecordingPartition partition;
    FixedScorer scorer;

    auto recs = make_records(4);
    recs[2].embedding.pop_back();

    ClusterEngine engine(reducer, density, partition, scorer);
    EXPECT_THROW(engine.cluster(recs, 3), faculty::ClusteringError);
}

TEST(ClusterEngineTest, PrimitiveFailureBecomesClusteringError) {
    IdentityReducer reducer;
    ScriptedDensity density;
    density.result.labels = {0, 0, 1, 1};
    RecordingPartition partition;
    ThrowingScorer scorer;

    ClusterEngine engine(reducer, density, partition, scorer);
    EXPECT_THROW(engine.cluster(make_records(4), 2), faculty::ClusteringError);
}

TEST(ClusterEngineTest, SingleLabelSkipsScoring) {
    IdentityReducer reducer;
    ScriptedDensity density;
    density.result.labels = std::vector<int>(4, -1);
    SinglePartition partition;
    FixedScorer scorer;

    ClusterEngine engine(reducer, density, partition, scorer);
    auto rep = engine.cluster(make_records(4), 2);
    EXPECT_EQ(scorer.calls, 0);
    EXPECT_DOUBLE_EQ(rep.silhouette_score, -1.0);
    EXPECT_EQ(rep.total_clusters, 1u);
}

TEST(ClusterEngineTest, ScoresWhenTwoLabelsPresent) {
    IdentityReducer reducer;
    ScriptedDensity density;
    density.result.labels = {0, 0, 1, 1};
    RecordingPartition partition;
    FixedScorer scorer;

    ClusterEngine engine(reducer, density, partition, scorer);
    auto rep = engine.cluster(make_records(4), 2);
    EXPECT_EQ(scorer.calls, 1);
    EXPECT_DOUBLE_EQ(rep.silhouette_score, 0.42);
}

TEST(ClusterEngineTest, EndToEndWithShippedPrimitives) {
    cluster::PcaReducer pca;
    cluster::DbscanClusterer dbscan(0.5);
    cluster::KMeansClusterer kmeans;
    cluster::EuclideanSilhouette silhouette;
    ClusterEngine engine(pca, dbscan, kmeans, silhouette);

    auto recs = make_records(24, 6);
    auto rep = engine.cluster(recs, 3);

    EXPECT_EQ(member_total(rep), 24u);
    EXPECT_TRUE(rep.algorithm == "density" || rep.algorithm == "partition");
    for (size_t i = 1; i < rep.clusters.size(); ++i) {
        EXPECT_LE(rep.clusters[i].size(), rep.clusters[i - 1].size());
    }
    for (const auto& c : rep.clusters) {
        EXPECT_GE(c.cluster_id, 0);
        EXPECT_LT(c.cluster_id, (int)rep.total_clusters);
    }
    if (rep.algorithm == "partition") EXPECT_EQ(rep.total_clusters, 3u);
    EXPECT_GE(rep.silhouette_score, -1.0);
    EXPECT_LE(rep.silhouette_score, 1.0);
}
