#include "keywords.hpp"
#include "clients/http_analyzer.hpp"
#ifdef KANKODORI_HAS_MECAB
#include "clients/mecab_analyzer.hpp"
#endif
#include "config.hpp"
#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>

namespace kankodori {

std::set<std::string> filter_morphemes(const std::vector<Morpheme>& morphemes,
                                       uint32_t min_length,
                                       const std::vector<std::string>& allowed_pos) {
    std::set<std::string> keywords;
    for (const auto& m : morphemes) {
        if (m.surface.empty()) continue;
        if (utf8_length(m.surface) < min_length) continue;
        if (std::find(allowed_pos.begin(), allowed_pos.end(), m.pos) == allowed_pos.end()) continue;
        keywords.insert(m.surface);
    }
    return keywords;
}

// CJK separators that never belong inside a place name
static const char* const kCjkSeparators[] = {
    "\xE3\x80\x80", // ideographic space
    "\xE3\x80\x81", // 、
    "\xE3\x80\x82", // 。
    "\xE3\x80\x8C", // 「
    "\xE3\x80\x8D", // 」
    "\xE3\x83\xBB", // ・
    "\xEF\xBC\x81", // ！
    "\xEF\xBC\x9F", // ？
    "\xEF\xBC\x8C", // ，
};

static size_t cjk_separator_at(const std::string& s, size_t i) {
    for (const char* sep : kCjkSeparators) {
        size_t n = std::char_traits<char>::length(sep);
        if (s.compare(i, n, sep) == 0) return n;
    }
    return 0;
}

enum class Script { Latin, Hiragana, Katakana, Other };

// Decode the code point starting at s[i]; n receives its byte length.
static uint32_t code_point_at(const std::string& s, size_t i, size_t& n) {
    auto c = static_cast<unsigned char>(s[i]);
    uint32_t cp = c;
    n = 1;
    if (c >= 0xF0) { n = 4; cp = c & 0x07; }
    else if (c >= 0xE0) { n = 3; cp = c & 0x0F; }
    else if (c >= 0xC0) { n = 2; cp = c & 0x1F; }
    if (i + n > s.size()) {
        n = 1;
        return c;
    }
    for (size_t k = 1; k < n; ++k) {
        cp = (cp << 6) | (static_cast<unsigned char>(s[i + k]) & 0x3F);
    }
    return cp;
}

static Script script_of(uint32_t cp) {
    if (cp < 0x80) return Script::Latin;
    if (cp >= 0x3041 && cp <= 0x309F) return Script::Hiragana;
    if (cp >= 0x30A0 && cp <= 0x30FF) return Script::Katakana;
    return Script::Other;
}

// Without a dictionary, a change of script is the best available word
// boundary: place names are kanji or katakana, while particles and
// inflections between them are hiragana.
std::vector<Morpheme> TokenKeywordExtractor::tokenize(const std::string& text) {
    std::vector<Morpheme> tokens;
    std::string token;
    Script token_script = Script::Latin;

    auto flush = [&] {
        if (!token.empty()) {
            tokens.push_back({token, token_script == Script::Hiragana ? "助詞" : "名詞"});
            token.clear();
        }
    };

    size_t i = 0;
    while (i < text.size()) {
        auto c = static_cast<unsigned char>(text[i]);
        if (c < 0x80 && (std::isspace(c) || std::ispunct(c))) {
            flush();
            i++;
            continue;
        }
        size_t sep = cjk_separator_at(text, i);
        if (sep > 0) {
            flush();
            i += sep;
            continue;
        }

        size_t n = 1;
        Script script = script_of(code_point_at(text, i, n));
        if (!token.empty() && script != token_script) flush();
        token_script = script;
        token.append(text, i, n);
        i += n;
    }
    flush();
    return tokens;
}

TokenKeywordExtractor::TokenKeywordExtractor(uint32_t min_length,
                                             std::vector<std::string> allowed_pos)
    : min_length_(min_length), allowed_pos_(std::move(allowed_pos)) {}

std::set<std::string> TokenKeywordExtractor::extract(const std::string& text) {
    return filter_morphemes(tokenize(text), min_length_, allowed_pos_);
}

std::unique_ptr<KeywordExtractor> create_keyword_extractor(const KeywordConfig& config,
                                                           HttpClient& http) {
    if (!config.analyzer_url.empty()) {
        return std::make_unique<HttpKeywordExtractor>(
            http, config.analyzer_url, config.min_length, config.pos);
    }
#ifdef KANKODORI_HAS_MECAB
    try {
        return std::make_unique<MecabKeywordExtractor>(
            config.mecab_args, config.min_length, config.pos);
    } catch (const std::runtime_error& e) {
        std::cerr << "[keywords] " << e.what() << ", using the token splitter\n";
    }
#endif
    return std::make_unique<TokenKeywordExtractor>(config.min_length, config.pos);
}

} // namespace kankodori
