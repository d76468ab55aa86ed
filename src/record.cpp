#include "record.hpp"
#include <cstdint>

namespace kankodori {

static const char* const kKnownFields[] = {
    "id", "name", "location", "title", "tag", "explain",
    "caption", "caption_ja", "description"
};

static bool is_known_field(const std::string& key) {
    for (const char* f : kKnownFields) {
        if (key == f) return true;
    }
    return false;
}

// Strings pass through; arrays of strings are comma-joined; numbers are
// rendered (some catalogs store numeric ids); anything else is empty.
static std::string string_field(const nlohmann::json& item, const char* key) {
    auto it = item.find(key);
    if (it == item.end()) return {};
    if (it->is_string()) return it->get<std::string>();
    if (it->is_number_integer()) return std::to_string(it->get<int64_t>());
    if (it->is_array()) {
        std::string joined;
        for (const auto& v : *it) {
            if (!v.is_string()) continue;
            if (!joined.empty()) joined += ",";
            joined += v.get<std::string>();
        }
        return joined;
    }
    return {};
}

// description is stored as {"_content": "..."}; a plain string is accepted too.
// Returns true only for the exact {"_content": string} shape, which
// record_to_json reproduces without help.
static bool read_description(const nlohmann::json& value, std::string& out) {
    if (value.is_string()) {
        out = value.get<std::string>();
        return false;
    }
    if (!value.is_object()) return false;
    auto content = value.find("_content");
    if (content == value.end() || !content->is_string()) return false;
    out = content->get<std::string>();
    return value.size() == 1;
}

Record record_from_json(const nlohmann::json& item) {
    Record r;
    if (!item.is_object()) return r;

    r.id = string_field(item, "id");
    r.name = string_field(item, "name");
    r.location = string_field(item, "location");
    r.title = string_field(item, "title");
    r.tag = string_field(item, "tag");
    r.explain = string_field(item, "explain");
    r.caption = string_field(item, "caption");
    r.caption_ja = string_field(item, "caption_ja");

    for (auto& [key, value] : item.items()) {
        if (key == "description") {
            if (!read_description(value, r.description)) r.extra_fields[key] = value;
        } else if (!is_known_field(key) || !value.is_string()) {
            r.extra_fields[key] = value;
        }
    }
    return r;
}

nlohmann::json record_to_json(const Record& record) {
    nlohmann::json item = {
        {"id", record.id},
        {"name", record.name},
        {"location", record.location},
        {"title", record.title},
        {"tag", record.tag},
        {"explain", record.explain},
        {"caption", record.caption},
        {"caption_ja", record.caption_ja},
        {"description", {{"_content", record.description}}}
    };
    for (const auto& [key, value] : record.extra_fields) {
        item[key] = value;
    }
    return item;
}

nlohmann::json scored_record_to_json(const ScoredRecord& scored) {
    nlohmann::json item = record_to_json(scored.record);
    if (scored.similarity_score) item["similarity_score"] = *scored.similarity_score;
    if (scored.text_similarity) item["text_similarity"] = *scored.text_similarity;
    if (scored.image_similarity) item["image_similarity"] = *scored.image_similarity;
    if (scored.combined_similarity) item["combined_similarity"] = *scored.combined_similarity;
    return item;
}

} // namespace kankodori
