#include "embedding_repository.hpp"
#include <iostream>

namespace kankodori {

EmbeddingRepository::EmbeddingRepository(std::unique_ptr<EmbeddingStore> text_store,
                                         std::unique_ptr<EmbeddingStore> image_store) {
    text_.store = std::move(text_store);
    image_.store = std::move(image_store);
}

std::shared_ptr<const EmbeddingMap> EmbeddingRepository::all_vectors(Modality m) {
    std::lock_guard<std::mutex> lock(mutex_);
    Slot& s = slot(m);
    if (s.map) return s.map;

    if (!s.store) {
        throw StoreUnavailable("no " + modality_to_string(m) + " embedding store configured");
    }

    auto map = std::make_shared<const EmbeddingMap>(s.store->load());
    std::cerr << "[embeddings] Loaded " << map->size() << " " << modality_to_string(m)
              << " vectors (" << s.store->backend_name() << ")\n";
    s.map = map;
    return map;
}

std::optional<Embedding> EmbeddingRepository::vector_for(Modality m, const std::string& id) {
    auto map = all_vectors(m);
    auto it = map->find(id);
    if (it == map->end()) return std::nullopt;
    return it->second;
}

void EmbeddingRepository::reload(Modality m) {
    std::lock_guard<std::mutex> lock(mutex_);
    slot(m).map.reset();
}

} // namespace kankodori
