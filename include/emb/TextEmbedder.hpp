#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace emb {

struct EmbedderConfig {
    std::string model_path = "models/emb/model.onnx";
    std::string vocab_path = "models/emb/vocab.txt";
    size_t max_len = 256;  // tokens incl. [CLS] and [SEP]
};

class TextEmbedder {
public:
    virtual ~TextEmbedder() = default;

    // one fixed-dimension vector per input text, same order.
    // throws faculty::EmbeddingGenerationError
    virtual std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts) const = 0;

    // 0 until the first vector has been produced
    virtual size_t dim() const = 0;
};

}  // namespace emb
