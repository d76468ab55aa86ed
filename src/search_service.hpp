#pragma once
#include "encoder.hpp"
#include "fusion.hpp"
#include "image_generator.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace kankodori {

// Literal marking "not supplied" for the text and image arguments.
// Distinct from an empty string.
inline constexpr const char* kNullArg = "null";

struct SearchResponse {
    int weight = 0;
    std::vector<ScoredRecord> results;  // at most max_results entries
    size_t total_found = 0;             // before truncation

    nlohmann::json to_json() const;
};

// Resolves the caller-facing arguments of a search into query vectors and
// runs the fusion engine.
class SearchService {
public:
    // generator may be null (no text-to-image fallback).
    SearchService(FusionEngine& engine, ImageEncoder& image_encoder,
                  ImageGenerator* generator, std::string query_dir,
                  uint32_t max_results);

    // weight: 0 (text) .. 100 (image); text and image_ref may be "null".
    // Throws CatalogUnavailable.
    SearchResponse search(int weight, const std::string& text, const std::string& image_ref);

    // Absolute refs are used as-is; relative refs live in the query directory.
    std::string resolve_image_path(const std::string& image_ref) const;

private:
    std::optional<Embedding> image_query(int weight, const std::optional<std::string>& text,
                                         const std::string& image_ref);

    FusionEngine& engine_;
    ImageEncoder& image_encoder_;
    ImageGenerator* generator_;
    std::string query_dir_;
    uint32_t max_results_;
};

} // namespace kankodori
