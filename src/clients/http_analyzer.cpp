#include "http_analyzer.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

namespace kankodori {

std::vector<Morpheme> parse_morphemes(const std::string& body) {
    std::vector<Morpheme> result;
    auto j = nlohmann::json::parse(body);

    // Accept a bare array or {"morphemes": [...]}
    const nlohmann::json* arr = &j;
    if (j.is_object() && j.contains("morphemes")) arr = &j["morphemes"];
    if (!arr->is_array()) return result;

    for (const auto& item : *arr) {
        if (!item.is_object()) continue;
        auto surface = item.find("surface");
        if (surface == item.end() || !surface->is_string()) continue;

        std::string pos = item.value("pos", "");
        auto comma = pos.find(',');
        if (comma != std::string::npos) pos.resize(comma);

        result.push_back({surface->get<std::string>(), pos});
    }
    return result;
}

HttpKeywordExtractor::HttpKeywordExtractor(HttpClient& http, std::string url,
                                           uint32_t min_length,
                                           std::vector<std::string> allowed_pos)
    : http_(http), url_(std::move(url)), min_length_(min_length),
      allowed_pos_(std::move(allowed_pos)) {}

std::set<std::string> HttpKeywordExtractor::extract(const std::string& text) {
    if (text.empty()) return {};

    nlohmann::json body = {{"text", text}};
    std::vector<Header> headers = {{"Content-Type", "application/json"}};

    auto response = http_.post(url_, body.dump(), headers, 30);
    if (response.status_code < 200 || response.status_code >= 300) {
        std::cerr << "[keywords] Analyzer request failed (HTTP " << response.status_code << ")\n";
        return {};
    }

    try {
        return filter_morphemes(parse_morphemes(response.body), min_length_, allowed_pos_);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[keywords] Malformed analyzer response: " << e.what() << "\n";
        return {};
    }
}

} // namespace kankodori
