#pragma once
#include "../embedding.hpp"
#include <memory>
#include <stdexcept>
#include <string>

namespace kankodori {

struct Config;

// The backing map for a modality is missing or corrupt.
// Recoverable: the modality contributes no candidates.
class StoreUnavailable : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Persistent id -> vector map for one modality.
class EmbeddingStore {
public:
    virtual ~EmbeddingStore() = default;

    virtual std::string backend_name() const = 0;

    // Read the whole map. Throws StoreUnavailable.
    virtual EmbeddingMap load() = 0;

    // Insert or replace one vector (ingestion write path).
    // Returns false if the store could not be written.
    virtual bool put(const std::string& id, const Embedding& vector) = 0;
};

// Throws StoreUnavailable unless every vector in the map is non-empty
// and has the same length.
void validate_dimensions(const EmbeddingMap& map, const std::string& source);

// Create the configured store backend ("json" or "sqlite") for a modality.
// Throws std::invalid_argument for an unknown or unavailable backend.
std::unique_ptr<EmbeddingStore> create_embedding_store(const Config& config, Modality modality);

} // namespace kankodori
