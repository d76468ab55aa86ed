#pragma once
#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace kankodori {

class HttpClient;     // forward declare
struct KeywordConfig; // forward declare

// One token from a morphological analyzer
struct Morpheme {
    std::string surface;
    std::string pos;      // top-level part of speech, e.g. "名詞"
};

// Abstract keyword extractor interface
class KeywordExtractor {
public:
    virtual ~KeywordExtractor() = default;

    // Candidate keywords for location matching. Never throws; empty on failure.
    virtual std::set<std::string> extract(const std::string& text) = 0;

    virtual std::string extractor_name() const = 0;
};

// Keep surfaces at least min_length code points long whose part of speech
// is in the allow-list.
std::set<std::string> filter_morphemes(const std::vector<Morpheme>& morphemes,
                                       uint32_t min_length,
                                       const std::vector<std::string>& allowed_pos);

// Dictionary-free splitter: breaks on whitespace, punctuation (ASCII and
// CJK) and changes of script. Hiragana runs are tagged as particles, every
// other token as a noun. Last fallback when neither an analyzer service
// nor MeCab is available.
class TokenKeywordExtractor : public KeywordExtractor {
public:
    TokenKeywordExtractor(uint32_t min_length, std::vector<std::string> allowed_pos);

    std::set<std::string> extract(const std::string& text) override;
    std::string extractor_name() const override { return "token"; }

    static std::vector<Morpheme> tokenize(const std::string& text);

private:
    uint32_t min_length_;
    std::vector<std::string> allowed_pos_;
};

// HTTP analyzer when analyzer_url is set, else MeCab when built in and a
// tagger can be created, else TokenKeywordExtractor.
std::unique_ptr<KeywordExtractor> create_keyword_extractor(const KeywordConfig& config,
                                                           HttpClient& http);

} // namespace kankodori
