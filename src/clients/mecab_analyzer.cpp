#include "mecab_analyzer.hpp"
#include <mecab.h>
#include <iostream>
#include <stdexcept>

namespace kankodori {

MecabKeywordExtractor::MecabKeywordExtractor(const std::string& tagger_args,
                                             uint32_t min_length,
                                             std::vector<std::string> allowed_pos)
    : tagger_(MeCab::createTagger(tagger_args.c_str())),
      min_length_(min_length), allowed_pos_(std::move(allowed_pos)) {
    if (!tagger_) {
        const char* err = MeCab::getTaggerError();
        throw std::runtime_error(std::string("cannot create MeCab tagger: ") +
                                 (err ? err : "unknown error"));
    }
}

MecabKeywordExtractor::~MecabKeywordExtractor() = default;

std::vector<Morpheme> MecabKeywordExtractor::analyze(const std::string& text) {
    std::vector<Morpheme> result;
    std::lock_guard<std::mutex> lock(mutex_);

    const MeCab::Node* node = tagger_->parseToNode(text.c_str());
    if (!node) {
        std::cerr << "[keywords] MeCab parse failed: " << tagger_->what() << "\n";
        return result;
    }

    for (; node; node = node->next) {
        if (node->stat == MECAB_BOS_NODE || node->stat == MECAB_EOS_NODE) continue;
        if (node->length == 0) continue;

        std::string pos = node->feature ? node->feature : "";
        auto comma = pos.find(',');
        if (comma != std::string::npos) pos.resize(comma);

        result.push_back({std::string(node->surface, node->length), pos});
    }
    return result;
}

std::set<std::string> MecabKeywordExtractor::extract(const std::string& text) {
    if (text.empty()) return {};
    return filter_morphemes(analyze(text), min_length_, allowed_pos_);
}

} // namespace kankodori
