#pragma once
#include "../keywords.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace MeCab { class Tagger; }

namespace kankodori {

// Keyword extractor on an in-process MeCab tagger.
// Throws std::runtime_error from the constructor if no tagger can be
// created (typically a missing dictionary).
class MecabKeywordExtractor : public KeywordExtractor {
public:
    MecabKeywordExtractor(const std::string& tagger_args, uint32_t min_length,
                          std::vector<std::string> allowed_pos);
    ~MecabKeywordExtractor() override;

    std::set<std::string> extract(const std::string& text) override;
    std::string extractor_name() const override { return "mecab"; }

    // Surface and top-level part of speech of every morpheme in text.
    std::vector<Morpheme> analyze(const std::string& text);

private:
    std::unique_ptr<MeCab::Tagger> tagger_;
    std::mutex mutex_; // MeCab::Tagger is not thread-safe
    uint32_t min_length_;
    std::vector<std::string> allowed_pos_;
};

} // namespace kankodori
