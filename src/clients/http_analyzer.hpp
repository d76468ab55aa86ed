#pragma once
#include "../keywords.hpp"
#include "../http.hpp"
#include <string>
#include <vector>

namespace kankodori {

// Keyword extractor backed by a morphological analysis service.
// POST {"text": ...}; expects [{"surface": ..., "pos": ...}, ...].
class HttpKeywordExtractor : public KeywordExtractor {
public:
    HttpKeywordExtractor(HttpClient& http, std::string url,
                         uint32_t min_length, std::vector<std::string> allowed_pos);

    std::set<std::string> extract(const std::string& text) override;
    std::string extractor_name() const override { return "http"; }

private:
    HttpClient& http_;
    std::string url_;
    uint32_t min_length_;
    std::vector<std::string> allowed_pos_;
};

// Parse an analyzer response body. Entries without a string surface are
// skipped; "pos" may be a full feature string ("名詞,固有名詞,...") and only
// its first field is kept.
std::vector<Morpheme> parse_morphemes(const std::string& body);

} // namespace kankodori
