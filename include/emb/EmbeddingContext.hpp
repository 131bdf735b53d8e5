#pragma once
#include "emb/TextEmbedder.hpp"
#include <functional>
#include <memory>

namespace emb {

// Owns the embedder for one invocation. Nothing is loaded until
// initialize(); shutdown() releases the model.
class EmbeddingContext {
public:
    using Factory = std::function<std::unique_ptr<TextEmbedder>()>;

    explicit EmbeddingContext(Factory factory);

    EmbeddingContext(const EmbeddingContext&) = delete;
    EmbeddingContext& operator=(const EmbeddingContext&) = delete;

    // no-op when already initialized. throws faculty::ModelInitializationError
    void initialize();
    void shutdown();

    bool initialized() const { return m_embedder != nullptr; }

    // throws faculty::ModelInitializationError when not initialized
    const TextEmbedder& embedder() const;

private:
    Factory m_factory;
    std::unique_ptr<TextEmbedder> m_embedder;
};

}  // namespace emb
