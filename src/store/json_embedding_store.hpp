#pragma once
#include "embedding_store.hpp"
#include <mutex>
#include <string>

namespace kankodori {

// Stores {"<id>": [f0, f1, ...], ...} in a single JSON file.
class JsonEmbeddingStore : public EmbeddingStore {
public:
    explicit JsonEmbeddingStore(std::string path);

    std::string backend_name() const override { return "json"; }
    EmbeddingMap load() override;
    bool put(const std::string& id, const Embedding& vector) override;

private:
    EmbeddingMap read_file_locked();

    std::string path_;
    std::mutex mutex_;
};

} // namespace kankodori
