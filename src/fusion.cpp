#include "fusion.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <unordered_map>

namespace kankodori {

double clamp_weight(double weight) {
    if (std::isnan(weight)) {
        std::cerr << "[fusion] Weight is NaN, using 0\n";
        return 0.0;
    }
    if (weight < 0.0 || weight > 100.0) {
        double clamped = std::clamp(weight, 0.0, 100.0);
        std::cerr << "[fusion] Weight " << weight << " out of range, using " << clamped << "\n";
        return clamped;
    }
    return weight;
}

SearchMode mode_for_weight(double weight) {
    if (weight <= 0.0) return SearchMode::TextOnly;
    if (weight >= 100.0) return SearchMode::ImageOnly;
    return SearchMode::Fused;
}

std::vector<FusedHit> merge_rankings(const std::vector<RankedHit>& text_hits,
                                     const std::vector<RankedHit>& image_hits,
                                     double image_weight) {
    std::unordered_map<std::string, FusedHit> merged;
    merged.reserve(text_hits.size() + image_hits.size());

    for (const auto& h : text_hits) {
        auto& f = merged[h.id];
        f.id = h.id;
        f.text = h.score;
    }
    for (const auto& h : image_hits) {
        auto& f = merged[h.id];
        f.id = h.id;
        f.image = h.score;
    }

    std::vector<FusedHit> result;
    result.reserve(merged.size());
    for (auto& [id, f] : merged) {
        f.combined = (1.0 - image_weight) * f.text + image_weight * f.image;
        result.push_back(std::move(f));
    }

    std::sort(result.begin(), result.end(), [](const FusedHit& a, const FusedHit& b) {
        if (a.combined != b.combined) return a.combined > b.combined;
        return a.id < b.id;
    });
    return result;
}

FusionEngine::FusionEngine(CatalogRepository& catalog, EmbeddingRepository& embeddings,
                           KeywordExtractor& extractor, TextEncoder& text_encoder)
    : catalog_(catalog),
      filter_(catalog, extractor),
      ranker_(embeddings),
      assembler_(catalog),
      text_encoder_(text_encoder) {}

Ranking FusionEngine::text_ranking(const std::optional<std::string>& query_text,
                                   const Catalog& catalog) {
    if (!query_text || query_text->empty()) {
        return {{}, RankStatus::NoSignal};
    }

    Embedding query = text_encoder_.encode(*query_text);
    if (is_zero_vector(query)) {
        std::cerr << "[fusion] Text query produced no signal\n";
        return {{}, RankStatus::NoSignal};
    }

    FilterResult filtered = filter_.filter(*query_text, catalog);
    std::optional<IdSet> restrict_to;
    if (filtered.candidates.empty()) {
        std::cerr << "[fusion] No location match, ranking the full catalog\n";
    } else {
        IdSet ids;
        for (const auto& r : filtered.candidates) ids.insert(r.id);
        restrict_to = std::move(ids);
    }

    try {
        return ranker_.rank(Modality::Text, query, restrict_to);
    } catch (const StoreUnavailable& e) {
        std::cerr << "[fusion] Text embeddings unavailable: " << e.what() << "\n";
        return {};
    }
}

Ranking FusionEngine::image_ranking(const std::optional<Embedding>& query_image) {
    if (!query_image || is_zero_vector(*query_image)) {
        std::cerr << "[fusion] Image query produced no signal\n";
        return {{}, RankStatus::NoSignal};
    }

    try {
        return ranker_.rank(Modality::Image, *query_image);
    } catch (const StoreUnavailable& e) {
        std::cerr << "[fusion] Image embeddings unavailable: " << e.what() << "\n";
        return {};
    }
}

std::vector<ScoredRecord> FusionEngine::search(double weight,
                                               const std::optional<std::string>& query_text,
                                               const std::optional<Embedding>& query_image) {
    // One snapshot for the whole request
    auto catalog = catalog_.snapshot();

    weight = clamp_weight(weight);
    switch (mode_for_weight(weight)) {
        case SearchMode::TextOnly: {
            Ranking text = text_ranking(query_text, *catalog);
            return assembler_.assemble(text.hits, *catalog);
        }
        case SearchMode::ImageOnly: {
            Ranking image = image_ranking(query_image);
            return assembler_.assemble(image.hits, *catalog);
        }
        case SearchMode::Fused:
            break;
    }

    Ranking text = text_ranking(query_text, *catalog);
    Ranking image = image_ranking(query_image);

    if (image.hits.empty()) {
        std::cerr << "[fusion] Image ranking empty, falling back to text only\n";
        return assembler_.assemble(text.hits, *catalog);
    }

    double image_weight = weight / 100.0;
    std::cerr << "[fusion] Blending text " << (1.0 - image_weight)
              << " / image " << image_weight << "\n";
    auto fused = merge_rankings(text.hits, image.hits, image_weight);
    return assembler_.assemble(fused, *catalog);
}

} // namespace kankodori
