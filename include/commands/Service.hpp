#pragma once
#include "cluster/ClusterEngine.hpp"
#include "cluster/Dbscan.hpp"
#include "cluster/KMeans.hpp"
#include "cluster/Pca.hpp"
#include "cluster/Silhouette.hpp"
#include "commands/Config.hpp"
#include "emb/EmbeddingContext.hpp"
#include "similarity/CosineBackend.hpp"
#include "similarity/SimilarityRanker.hpp"
#include "topics/TopicExtractor.hpp"

#include <memory>

// Everything one invocation needs, wired from AppConfig. The embedding
// model is loaded lazily by the commands that need it (test,
// generate_embeddings) and released in the destructor.
class Service {
public:
    explicit Service(const AppConfig& cfg);
    Service(const AppConfig& cfg, emb::EmbeddingContext::Factory embedder_factory);
    ~Service();

    Service(const Service&) = delete;
    Service& operator=(const Service&) = delete;

    emb::EmbeddingContext& embeddings() { return m_embeddings; }
    const similarity::SimilarityRanker& ranker() const { return m_ranker; }
    const cluster::ClusterEngine& clusters() const { return m_engine; }
    const topics::TopicExtractor& topics() const { return m_topics; }

private:
    emb::EmbeddingContext m_embeddings;

    std::unique_ptr<similarity::CosineBackend> m_cosine;
    similarity::SimilarityRanker m_ranker;

    cluster::PcaReducer m_pca;
    cluster::DbscanClusterer m_dbscan;
    cluster::KMeansClusterer m_kmeans;
    cluster::EuclideanSilhouette m_silhouette;
    cluster::ClusterEngine m_engine;

    topics::TopicExtractor m_topics;
};
