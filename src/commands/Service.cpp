#include "commands/Service.hpp"
#include "emb/MiniLmEmbedder.hpp"
#include "logging/Log.hpp"

Service::Service(const AppConfig& cfg)
    : Service(cfg, [emb_cfg = cfg.embedder]() -> std::unique_ptr<emb::TextEmbedder> {
          return std::make_unique<emb::MiniLmEmbedder>(emb_cfg);
      }) {}

Service::Service(const AppConfig& cfg, emb::EmbeddingContext::Factory embedder_factory)
    : m_embeddings(std::move(embedder_factory)),
      m_cosine(similarity::make_cosine_backend(cfg.similarity_backend)),
      m_ranker(*m_cosine),
      m_dbscan(cfg.dbscan_eps),
      m_engine(m_pca, m_dbscan, m_kmeans, m_silhouette) {
    logging::info("Service", std::string("similarity backend: ") + m_cosine->name());
}

Service::~Service() {
    m_embeddings.shutdown();
}
