#pragma once
#include "emb/TextEmbedder.hpp"
#include "emb/WordPieceTokenizer.hpp"
#include <memory>
#include <string>
#include <vector>

#include <onnxruntime_cxx_api.h>

namespace emb {

// all-MiniLM-L6-v2 exported to ONNX: mean pooling over the attention
// mask, then L2 normalization
class MiniLmEmbedder final : public TextEmbedder {
public:
    // throws faculty::ModelInitializationError
    explicit MiniLmEmbedder(const EmbedderConfig& cfg);

    std::vector<float> embed(const std::string& text) const;

    std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts) const override;
    size_t dim() const override { return m_dim; }

private:
    EmbedderConfig m_cfg;
    WordPieceTokenizer m_tok;

    Ort::Env m_env{ORT_LOGGING_LEVEL_WARNING, "faculty-sim"};
    Ort::SessionOptions m_opts;
    std::unique_ptr<Ort::Session> m_session;

    std::string m_in_ids = "input_ids";
    std::string m_in_mask = "attention_mask";
    std::string m_in_type = "token_type_ids";
    size_t m_num_inputs = 3;
    std::string m_out_name;

    mutable size_t m_dim = 0;
};

}  // namespace emb
