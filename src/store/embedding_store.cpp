#include "embedding_store.hpp"
#include "json_embedding_store.hpp"
#include "../config.hpp"
#ifdef KANKODORI_HAS_SQLITE_STORE
#include "sqlite_embedding_store.hpp"
#endif

namespace kankodori {

void validate_dimensions(const EmbeddingMap& map, const std::string& source) {
    size_t dim = 0;
    for (const auto& [id, vec] : map) {
        if (vec.empty()) {
            throw StoreUnavailable("empty vector for '" + id + "' in " + source);
        }
        if (dim == 0) {
            dim = vec.size();
        } else if (vec.size() != dim) {
            throw StoreUnavailable("mixed vector lengths in " + source + ": '" + id +
                                   "' has " + std::to_string(vec.size()) +
                                   ", expected " + std::to_string(dim));
        }
    }
}

std::unique_ptr<EmbeddingStore> create_embedding_store(const Config& config, Modality modality) {
    std::string path = config.embeddings_path(modality);

    if (config.store_backend == "json") {
        return std::make_unique<JsonEmbeddingStore>(path);
    }
#ifdef KANKODORI_HAS_SQLITE_STORE
    if (config.store_backend == "sqlite") {
        return std::make_unique<SqliteEmbeddingStore>(path);
    }
#endif
    throw std::invalid_argument("Unknown embedding store backend: " + config.store_backend);
}

} // namespace kankodori
