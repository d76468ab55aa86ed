#include "keyword_filter.hpp"
#include <iostream>

namespace kankodori {

KeywordFilter::KeywordFilter(CatalogRepository& catalog, KeywordExtractor& extractor)
    : catalog_(catalog), extractor_(extractor) {}

FilterResult KeywordFilter::filter(const std::string& query_text) {
    auto snap = catalog_.snapshot();
    return filter(query_text, *snap);
}

FilterResult KeywordFilter::filter(const std::string& query_text, const Catalog& catalog) {
    FilterResult result;
    result.keywords = extractor_.extract(query_text);
    if (result.keywords.empty()) {
        std::cerr << "[filter] No keywords extracted\n";
        return result;
    }

    result.candidates = catalog.by_location_keyword(result.keywords);
    for (const auto& r : result.candidates) {
        result.matched_locations.insert(r.location);
    }

    if (result.candidates.empty()) {
        std::cerr << "[filter] " << result.keywords.size()
                  << " keywords matched no location\n";
    } else {
        std::cerr << "[filter] " << result.candidates.size() << " records in "
                  << result.matched_locations.size() << " matched locations\n";
    }
    return result;
}

} // namespace kankodori
