#pragma once
#include "embedding.hpp"
#include "store/embedding_store.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace kankodori {

// Read-only access to the per-modality embedding maps.
// Each map is loaded from its store on first use and then shared by all
// searches. A failed load is not cached, so a repaired store is picked up
// by the next search.
class EmbeddingRepository {
public:
    EmbeddingRepository(std::unique_ptr<EmbeddingStore> text_store,
                        std::unique_ptr<EmbeddingStore> image_store);

    // Throws StoreUnavailable.
    std::shared_ptr<const EmbeddingMap> all_vectors(Modality m);

    // Throws StoreUnavailable. nullopt if the id has no vector.
    std::optional<Embedding> vector_for(Modality m, const std::string& id);

    // Drop a cached map so the next read goes back to the store.
    void reload(Modality m);

private:
    struct Slot {
        std::unique_ptr<EmbeddingStore> store;
        std::shared_ptr<const EmbeddingMap> map;
    };

    Slot& slot(Modality m) { return m == Modality::Text ? text_ : image_; }

    std::mutex mutex_;
    Slot text_;
    Slot image_;
};

} // namespace kankodori
