#pragma once
#include "catalog.hpp"
#include "keywords.hpp"
#include <set>
#include <string>
#include <vector>

namespace kankodori {

struct FilterResult {
    std::set<std::string> keywords;           // what the extractor produced
    std::vector<Record> candidates;           // records whose location matched
    std::set<std::string> matched_locations;  // distinct matched location values
};

// Narrows the catalog to records whose location mentions a query keyword.
// An empty candidate list means "no location signal": callers search the
// whole catalog instead.
class KeywordFilter {
public:
    KeywordFilter(CatalogRepository& catalog, KeywordExtractor& extractor);

    // Against the current catalog snapshot. Throws CatalogUnavailable.
    FilterResult filter(const std::string& query_text);

    // Against a snapshot the caller already holds.
    FilterResult filter(const std::string& query_text, const Catalog& catalog);

private:
    CatalogRepository& catalog_;
    KeywordExtractor& extractor_;
};

} // namespace kankodori
