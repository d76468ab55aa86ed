#include "search_service.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>

namespace kankodori {

nlohmann::json SearchResponse::to_json() const {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& r : results) {
        items.push_back(scored_record_to_json(r));
    }
    return {
        {"range", weight},
        {"result", items},
        {"total_found", total_found}
    };
}

SearchService::SearchService(FusionEngine& engine, ImageEncoder& image_encoder,
                             ImageGenerator* generator, std::string query_dir,
                             uint32_t max_results)
    : engine_(engine), image_encoder_(image_encoder), generator_(generator),
      query_dir_(std::move(query_dir)), max_results_(max_results) {}

std::string SearchService::resolve_image_path(const std::string& image_ref) const {
    std::filesystem::path p(image_ref);
    if (p.is_absolute() || query_dir_.empty()) return image_ref;
    return (std::filesystem::path(query_dir_) / p).string();
}

std::optional<Embedding> SearchService::image_query(int weight,
                                                    const std::optional<std::string>& text,
                                                    const std::string& image_ref) {
    // Text-only searches never touch the image side
    if (weight <= 0) return std::nullopt;

    if (image_ref != kNullArg) {
        return image_encoder_.encode(resolve_image_path(image_ref));
    }

    if (!text || !generator_) return std::nullopt;

    std::cerr << "[search] No query image, generating one from the text\n";
    auto generated = generator_->generate(*text);
    if (!generated) return std::nullopt;
    return image_encoder_.encode(*generated);
}

SearchResponse SearchService::search(int weight, const std::string& text,
                                     const std::string& image_ref) {
    SearchResponse response;
    response.weight = weight;

    int w = std::clamp(weight, 0, 100);
    std::optional<std::string> query_text;
    if (text != kNullArg) query_text = text;

    std::cerr << "[search] weight=" << weight << " text='" << text
              << "' image='" << image_ref << "'\n";

    if (!query_text && image_ref == kNullArg) {
        std::cerr << "[search] Neither text nor image supplied\n";
        return response;
    }

    auto image = image_query(w, query_text, image_ref);
    auto results = engine_.search(weight, query_text, image);

    response.total_found = results.size();
    if (results.size() > max_results_) results.resize(max_results_);
    response.results = std::move(results);
    return response;
}

} // namespace kankodori
