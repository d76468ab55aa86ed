#include "ranker.hpp"
#include <algorithm>
#include <iostream>

namespace kankodori {

bool hit_before(const RankedHit& a, const RankedHit& b) {
    if (a.score != b.score) return a.score > b.score;
    return a.id < b.id;
}

ModalityRanker::ModalityRanker(EmbeddingRepository& embeddings) : embeddings_(embeddings) {}

Ranking ModalityRanker::rank(Modality modality, const Embedding& query,
                             const std::optional<IdSet>& restrict_to) {
    if (is_zero_vector(query)) {
        std::cerr << "[ranker] " << modality_to_string(modality)
                  << " query vector is all zeros\n";
        return {{}, RankStatus::NoSignal};
    }

    auto map = embeddings_.all_vectors(modality);
    Ranking ranking = rank_map(query, *map, restrict_to);
    if (!ranking.hits.empty()) {
        std::cerr << "[ranker] " << modality_to_string(modality) << ": "
                  << ranking.hits.size() << " candidates, top score "
                  << ranking.hits.front().score << "\n";
    }
    return ranking;
}

Ranking ModalityRanker::rank_map(const Embedding& query, const EmbeddingMap& map,
                                 const std::optional<IdSet>& restrict_to) {
    Ranking ranking;
    if (is_zero_vector(query)) {
        ranking.status = RankStatus::NoSignal;
        return ranking;
    }

    size_t mismatched = 0;
    ranking.hits.reserve(restrict_to ? restrict_to->size() : map.size());
    for (const auto& [id, vec] : map) {
        if (restrict_to && restrict_to->count(id) == 0) continue;

        double score = 0.0;
        if (vec.size() != query.size()) {
            mismatched++;
        } else if (!is_zero_vector(vec)) {
            score = cosine_similarity(query, vec);
        }
        ranking.hits.push_back({id, score});
    }

    if (mismatched > 0) {
        std::cerr << "[ranker] " << mismatched << " stored vectors differ in length from the query ("
                  << query.size() << ")\n";
    }

    std::sort(ranking.hits.begin(), ranking.hits.end(), hit_before);
    return ranking;
}

} // namespace kankodori
