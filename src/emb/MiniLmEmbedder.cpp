#include "emb/MiniLmEmbedder.hpp"
#include "faculty/Errors.hpp"
#include "logging/Log.hpp"
#include <cmath>

namespace emb {

MiniLmEmbedder::MiniLmEmbedder(const EmbedderConfig& cfg) : m_cfg(cfg) {
    m_tok.load_vocab(m_cfg.vocab_path);

    try {
        m_opts.SetIntraOpNumThreads(1);
        m_opts.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);

#ifdef _WIN32
        std::wstring wmodel(m_cfg.model_path.begin(), m_cfg.model_path.end());
        m_session = std::make_unique<Ort::Session>(m_env, wmodel.c_str(), m_opts);
#else
        m_session = std::make_unique<Ort::Session>(m_env, m_cfg.model_path.c_str(), m_opts);
#endif

        Ort::AllocatorWithDefaultOptions allocator;
        auto name_alloc = m_session->GetOutputNameAllocated(0, allocator);
        m_out_name = name_alloc.get();

        // some exports drop token_type_ids
        m_num_inputs = m_session->GetInputCount();
        if (m_num_inputs < 2 || m_num_inputs > 3) {
            throw faculty::ModelInitializationError(
                "unexpected model input count: " + std::to_string(m_num_inputs));
        }
        auto in0 = m_session->GetInputNameAllocated(0, allocator);
        auto in1 = m_session->GetInputNameAllocated(1, allocator);
        m_in_ids = in0.get();
        m_in_mask = in1.get();
        if (m_num_inputs == 3) {
            auto in2 = m_session->GetInputNameAllocated(2, allocator);
            m_in_type = in2.get();
        }
    } catch (const Ort::Exception& e) {
        throw faculty::ModelInitializationError(
            std::string("ONNX Runtime failed to load ") + m_cfg.model_path + ": " + e.what());
    }

    logging::info("MiniLmEmbedder", "loaded " + m_cfg.model_path +
                  " (vocab=" + std::to_string(m_tok.vocab_size()) + ")");
}

static void l2_normalize(std::vector<float>& v) {
    double ss = 0.0;
    for (float x : v) ss += (double)x * (double)x;
    if (ss <= 0.0) return;
    double inv = 1.0 / std::sqrt(ss);
    for (float& x : v) x = (float)(x * inv);
}

std::vector<float> MiniLmEmbedder::embed(const std::string& text) const {
    std::vector<int64_t> ids = m_tok.encode(text, m_cfg.max_len);
    const size_t seq_len = ids.size();

    std::vector<int64_t> mask(seq_len, 1);
    std::vector<int64_t> type_ids(seq_len, 0);

    std::vector<int64_t> shape{1, (int64_t)seq_len};

    Ort::MemoryInfo mem = Ort::MemoryInfo::CreateCpu(OrtDeviceAllocator, OrtMemTypeCPU);

    std::vector<Ort::Value> in_vals;
    in_vals.push_back(Ort::Value::CreateTensor<int64_t>(mem, ids.data(), ids.size(), shape.data(), shape.size()));
    in_vals.push_back(Ort::Value::CreateTensor<int64_t>(mem, mask.data(), mask.size(), shape.data(), shape.size()));
    if (m_num_inputs == 3) {
        in_vals.push_back(Ort::Value::CreateTensor<int64_t>(mem, type_ids.data(), type_ids.size(), shape.data(), shape.size()));
    }

    const char* in_names[3] = { m_in_ids.c_str(), m_in_mask.c_str(), m_in_type.c_str() };
    const char* out_names[1] = { m_out_name.c_str() };

    std::vector<Ort::Value> outs;
    try {
        outs = m_session->Run(Ort::RunOptions{nullptr}, in_names, in_vals.data(), m_num_inputs, out_names, 1);
    } catch (const Ort::Exception& e) {
        throw faculty::EmbeddingGenerationError(std::string("ONNX Runtime run failed: ") + e.what());
    }

    Ort::Value& out = outs[0];
    auto shp = out.GetTensorTypeAndShapeInfo().GetShape(); // [1, seq_len, hidden]
    if (shp.size() != 3 || shp[2] <= 0) {
        throw faculty::EmbeddingGenerationError("unexpected model output rank");
    }

    const size_t hidden = (size_t)shp[2];
    const float* data = out.GetTensorData<float>();

    std::vector<float> pooled(hidden, 0.0f);
    double denom = 0.0;

    // output is contiguous as [1, seq_len, hidden]
    for (size_t t = 0; t < seq_len; ++t) {
        if (mask[t] == 0) continue;
        denom += 1.0;
        const float* row = data + (t * hidden);
        for (size_t j = 0; j < hidden; ++j) pooled[j] += row[j];
    }

    if (denom > 0.0) {
        float inv = (float)(1.0 / denom);
        for (float& x : pooled) x *= inv;
    }

    l2_normalize(pooled);
    return pooled;
}

std::vector<std::vector<float>> MiniLmEmbedder::embed_batch(const std::vector<std::string>& texts) const {
    std::vector<std::vector<float>> out;
    out.reserve(texts.size());

    for (const auto& t : texts) {
        std::vector<float> v = embed(t);
        if (m_dim == 0) m_dim = v.size();
        if (v.size() != m_dim) {
            throw faculty::EmbeddingGenerationError("inconsistent embedding dim");
        }
        out.push_back(std::move(v));
    }
    return out;
}

}  // namespace emb
