#pragma once
#include "catalog.hpp"
#include "embedding_repository.hpp"
#include "encoder.hpp"
#include "keyword_filter.hpp"
#include "ranker.hpp"
#include "result_assembler.hpp"
#include <optional>
#include <string>
#include <vector>

namespace kankodori {

enum class SearchMode { TextOnly, ImageOnly, Fused };

// Clamp a caller weight into [0, 100]. Out-of-range values are logged.
double clamp_weight(double weight);

// 0 -> TextOnly, 100 -> ImageOnly, anything between -> Fused.
// Expects a clamped weight.
SearchMode mode_for_weight(double weight);

// Weighted union of two rankings:
//   combined = (1 - image_weight) * text + image_weight * image
// An id missing from one ranking scores 0.0 on that side.
// Result is sorted descending by combined, ties by ascending id.
std::vector<FusedHit> merge_rankings(const std::vector<RankedHit>& text_hits,
                                     const std::vector<RankedHit>& image_hits,
                                     double image_weight);

// Multi-modal search over the catalog.
// Blends text and image similarity under a weight in [0, 100], where 0 is
// text only and 100 is image only. A modality whose store is unavailable or
// whose query carries no signal contributes nothing; only a missing catalog
// is an error (CatalogUnavailable propagates).
class FusionEngine {
public:
    FusionEngine(CatalogRepository& catalog, EmbeddingRepository& embeddings,
                 KeywordExtractor& extractor, TextEncoder& text_encoder);

    std::vector<ScoredRecord> search(double weight,
                                     const std::optional<std::string>& query_text,
                                     const std::optional<Embedding>& query_image);

    // Text pipeline: keyword prefilter, then cosine ranking restricted to
    // the matched records (or the whole map when nothing matched).
    Ranking text_ranking(const std::optional<std::string>& query_text, const Catalog& catalog);

    // Image pipeline: cosine ranking over the whole image map.
    Ranking image_ranking(const std::optional<Embedding>& query_image);

private:
    CatalogRepository& catalog_;
    KeywordFilter filter_;
    ModalityRanker ranker_;
    ResultAssembler assembler_;
    TextEncoder& text_encoder_;
};

} // namespace kankodori
