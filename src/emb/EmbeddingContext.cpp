#include "emb/EmbeddingContext.hpp"
#include "faculty/Errors.hpp"

namespace emb {

EmbeddingContext::EmbeddingContext(Factory factory) : m_factory(std::move(factory)) {}

void EmbeddingContext::initialize() {
    if (m_embedder) return;
    if (!m_factory) throw faculty::ModelInitializationError("no embedder factory configured");

    std::unique_ptr<TextEmbedder> e = m_factory();
    if (!e) throw faculty::ModelInitializationError("embedder factory returned null");
    m_embedder = std::move(e);
}

void EmbeddingContext::shutdown() {
    m_embedder.reset();
}

const TextEmbedder& EmbeddingContext::embedder() const {
    if (!m_embedder) throw faculty::ModelInitializationError("embedding model is not initialized");
    return *m_embedder;
}

}  // namespace emb
