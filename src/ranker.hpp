#pragma once
#include "embedding.hpp"
#include "embedding_repository.hpp"
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace kankodori {

struct RankedHit {
    std::string id;
    double score = 0.0;
};

enum class RankStatus {
    Ok,
    NoSignal,  // the query vector was all zeros; hits is empty
};

struct Ranking {
    std::vector<RankedHit> hits;   // descending by score, ties by ascending id
    RankStatus status = RankStatus::Ok;
};

using IdSet = std::unordered_set<std::string>;

// Brute-force cosine ranking of one modality's embedding map.
class ModalityRanker {
public:
    explicit ModalityRanker(EmbeddingRepository& embeddings);

    // Rank the stored vectors of a modality against query.
    // Throws StoreUnavailable if the modality's map cannot be loaded.
    Ranking rank(Modality modality, const Embedding& query,
                 const std::optional<IdSet>& restrict_to = std::nullopt);

    // Rank an explicit map. Stored zero vectors, and vectors whose length
    // differs from the query, are kept with score 0.0.
    static Ranking rank_map(const Embedding& query, const EmbeddingMap& map,
                            const std::optional<IdSet>& restrict_to = std::nullopt);

private:
    EmbeddingRepository& embeddings_;
};

// Descending by score, ascending id on equal scores
bool hit_before(const RankedHit& a, const RankedHit& b);

} // namespace kankodori
