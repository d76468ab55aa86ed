#pragma once
#include "embedding_store.hpp"
#include <mutex>
#include <string>

namespace kankodori {

// Stores vectors as raw float BLOBs in table embeddings(id, vector).
// The database is opened per call: read-only for load(), created on put().
class SqliteEmbeddingStore : public EmbeddingStore {
public:
    explicit SqliteEmbeddingStore(std::string path);

    std::string backend_name() const override { return "sqlite"; }
    EmbeddingMap load() override;
    bool put(const std::string& id, const Embedding& vector) override;

private:
    std::string path_;
    std::mutex mutex_;
};

} // namespace kankodori
