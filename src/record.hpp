#pragma once
#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>

namespace kankodori {

// One catalog entry (a photo of a tourist spot).
struct Record {
    std::string id;
    std::string name;        // display name, dedup key
    std::string location;
    std::string title;
    std::string tag;
    std::string explain;
    std::string caption;
    std::string caption_ja;
    std::string description; // description._content in the catalog file

    // Catalog values not held verbatim above, in their original JSON form:
    // unknown keys of any type, and known keys whose value is not a plain
    // string (e.g. a tag array). record_to_json writes them back unchanged.
    std::map<std::string, nlohmann::json> extra_fields;
};

// A record with the scores of the current request attached.
struct ScoredRecord {
    Record record;
    std::optional<double> similarity_score;
    std::optional<double> text_similarity;
    std::optional<double> image_similarity;
    std::optional<double> combined_similarity;
};

Record record_from_json(const nlohmann::json& item);
nlohmann::json record_to_json(const Record& record);
nlohmann::json scored_record_to_json(const ScoredRecord& scored);

} // namespace kankodori
