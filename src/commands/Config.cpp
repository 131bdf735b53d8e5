#include "commands/Config.hpp"
#include "faculty/Errors.hpp"

#include <cstdlib>
#include <ostream>
#include <stdexcept>

static bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

static std::string env_or(const char* name, const std::string& def) {
    const char* v = std::getenv(name);
    return (v && *v) ? std::string(v) : def;
}

AppConfig parse_config(int argc, char** argv) {
    AppConfig cfg;

    const std::string model_def = env_or("FACULTY_SIM_MODEL", cfg.embedder.model_path);
    const std::string vocab_def = env_or("FACULTY_SIM_VOCAB", cfg.embedder.vocab_path);

    cfg.embedder.model_path = get_arg(argc, argv, "--model", model_def);
    cfg.embedder.vocab_path = get_arg(argc, argv, "--vocab", vocab_def);
    cfg.similarity_backend  = get_arg(argc, argv, "--similarity", cfg.similarity_backend);
    cfg.verbose             = has_flag(argc, argv, "--verbose");

    const std::string max_len_s = get_arg(argc, argv, "--max_len", "");
    if (!max_len_s.empty()) {
        size_t v = 0;
        try { v = (size_t)std::stoul(max_len_s); }
        catch (const std::exception&) { throw faculty::InputValidationError("invalid --max_len: " + max_len_s); }
        if (v < 2) throw faculty::InputValidationError("--max_len must be >= 2");
        cfg.embedder.max_len = v;
    }

    const std::string eps_s = get_arg(argc, argv, "--dbscan_eps", "");
    if (!eps_s.empty()) {
        double v = 0.0;
        try { v = std::stod(eps_s); }
        catch (const std::exception&) { throw faculty::InputValidationError("invalid --dbscan_eps: " + eps_s); }
        if (!(v > 0.0)) throw faculty::InputValidationError("--dbscan_eps must be > 0");
        cfg.dbscan_eps = v;
    }

    if (cfg.similarity_backend != "eigen" && cfg.similarity_backend != "scalar") {
        throw faculty::InputValidationError("invalid --similarity: " + cfg.similarity_backend + " (expected eigen|scalar)");
    }
    return cfg;
}

void print_usage(std::ostream& os) {
    os
        << "usage:\n"
        << "  faculty-sim <command> [options] < request.json\n"
        << "\n"
        << "commands:\n"
        << "  test                         load the embedding model\n"
        << "  generate_embeddings          {texts}\n"
        << "  find_similar                 {target_embedding, all_embeddings, faculty_data, top_k?, threshold?}\n"
        << "  cluster_faculty              {embeddings, faculty_data, min_cluster_size?}\n"
        << "  analyze_topics               {faculty_data, num_topics?}\n"
        << "  similarity_matrix            {embeddings}\n"
        << "  help\n"
        << "\n"
        << "options:\n"
        << "  --model <path>               default: models/emb/model.onnx (env FACULTY_SIM_MODEL)\n"
        << "  --vocab <path>               default: models/emb/vocab.txt (env FACULTY_SIM_VOCAB)\n"
        << "  --max_len <n>                default: 256\n"
        << "  --similarity <eigen|scalar>  default: eigen\n"
        << "  --dbscan_eps <f>             default: 0.5\n"
        << "  --verbose                    log progress to stderr\n";
}
