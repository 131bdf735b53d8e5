#include "commands/Commands.hpp"
#include "io/JsonIO.hpp"
#include "logging/Log.hpp"
#include "text/TextUtil.hpp"

using json = nlohmann::json;

json cmd_test(Service& svc) {
    try {
        svc.embeddings().initialize();
        return {{"success", true}, {"message", "All dependencies loaded successfully"}};
    } catch (const std::exception& e) {
        return failure("test", std::string("Failed to initialize model: ") + e.what());
    }
}

json cmd_generate_embeddings(Service& svc, const json& in) {
    try {
        std::vector<std::string> texts = io::parse_texts(in, "texts");
        for (auto& t : texts) t = textutil::clean_text(t);

        svc.embeddings().initialize();
        auto vecs = svc.embeddings().embedder().embed_batch(texts);

        logging::info("generate_embeddings", "embedded " + std::to_string(vecs.size()) + " texts (dim=" +
                      std::to_string(svc.embeddings().embedder().dim()) + ")");
        return {{"success", true}, {"embeddings", vecs}};
    } catch (const std::exception& e) {
        return failure("generate_embeddings", e);
    }
}
