#include "result_assembler.hpp"
#include <iostream>
#include <unordered_set>

namespace kankodori {

namespace {

template <typename Hit, typename Attach>
std::vector<ScoredRecord> assemble_hits(const std::vector<Hit>& hits, const Catalog& catalog,
                                        Attach attach) {
    std::vector<ScoredRecord> out;
    std::unordered_set<std::string> seen_names;

    for (const auto& hit : hits) {
        const Record* record = catalog.find(hit.id);
        if (!record) {
            std::cerr << "[assembler] Warning: ranked id '" << hit.id
                      << "' has no catalog record\n";
            continue;
        }
        if (!seen_names.insert(record->name).second) continue;

        ScoredRecord scored;
        scored.record = *record;
        attach(scored, hit);
        out.push_back(std::move(scored));
    }
    return out;
}

} // namespace

ResultAssembler::ResultAssembler(CatalogRepository& catalog) : catalog_(catalog) {}

std::vector<ScoredRecord> ResultAssembler::assemble(const std::vector<RankedHit>& hits) {
    auto snap = catalog_.snapshot();
    return assemble(hits, *snap);
}

std::vector<ScoredRecord> ResultAssembler::assemble(const std::vector<RankedHit>& hits,
                                                    const Catalog& catalog) const {
    return assemble_hits(hits, catalog, [](ScoredRecord& s, const RankedHit& h) {
        s.similarity_score = h.score;
    });
}

std::vector<ScoredRecord> ResultAssembler::assemble(const std::vector<FusedHit>& hits,
                                                    const Catalog& catalog) const {
    return assemble_hits(hits, catalog, [](ScoredRecord& s, const FusedHit& h) {
        s.text_similarity = h.text;
        s.image_similarity = h.image;
        s.combined_similarity = h.combined;
    });
}

} // namespace kankodori
