#pragma once
#include "emb/TextEmbedder.hpp"
#include <iosfwd>
#include <string>

struct AppConfig {
    emb::EmbedderConfig embedder;
    std::string similarity_backend = "eigen";  // eigen | scalar
    double dbscan_eps = 0.5;
    bool verbose = false;
};

// --model, --vocab, --max_len, --similarity, --dbscan_eps, --verbose.
// FACULTY_SIM_MODEL / FACULTY_SIM_VOCAB replace the path defaults.
// throws faculty::InputValidationError on bad values
AppConfig parse_config(int argc, char** argv);

void print_usage(std::ostream& os);
