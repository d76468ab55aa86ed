#pragma once
#include "catalog.hpp"
#include "ranker.hpp"
#include <string>
#include <vector>

namespace kankodori {

// A hit of the fused ranking, with both per-modality scores kept.
struct FusedHit {
    std::string id;
    double combined = 0.0;
    double text = 0.0;
    double image = 0.0;
};

// Turns a ranked id sequence into catalog records.
// Ids with no record are skipped; each display name appears once, at the
// position of its best-ranked id. Records are copies; the catalog is never
// modified.
class ResultAssembler {
public:
    explicit ResultAssembler(CatalogRepository& catalog);

    // Single-modality hits: similarity_score is attached.
    std::vector<ScoredRecord> assemble(const std::vector<RankedHit>& hits);
    std::vector<ScoredRecord> assemble(const std::vector<RankedHit>& hits,
                                       const Catalog& catalog) const;

    // Fused hits: text_similarity, image_similarity and combined_similarity
    // are attached.
    std::vector<ScoredRecord> assemble(const std::vector<FusedHit>& hits,
                                       const Catalog& catalog) const;

private:
    CatalogRepository& catalog_;
};

} // namespace kankodori
