#include "catalog.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

namespace kankodori {

Catalog::Catalog(std::vector<Record> records) : records_(std::move(records)) {
    id_index_.reserve(records_.size());
    for (size_t i = 0; i < records_.size(); ++i) {
        // First occurrence wins for duplicate ids
        id_index_.emplace(records_[i].id, i);
    }
}

const Record* Catalog::find(const std::string& id) const {
    auto it = id_index_.find(id);
    if (it == id_index_.end()) return nullptr;
    return &records_[it->second];
}

std::vector<Record> Catalog::by_location_keyword(const std::set<std::string>& keywords) const {
    std::vector<Record> result;
    if (keywords.empty()) return result;

    for (const auto& record : records_) {
        if (record.location.empty()) continue;
        for (const auto& kw : keywords) {
            if (!kw.empty() && record.location.find(kw) != std::string::npos) {
                result.push_back(record);
                break;
            }
        }
    }
    return result;
}

std::shared_ptr<const Catalog> parse_catalog(const std::string& json_str,
                                             const std::string& source) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_str);
    } catch (const nlohmann::json::parse_error& e) {
        throw CatalogUnavailable("catalog is not valid JSON: " + source + ": " + e.what());
    }

    if (!j.is_object() || !j.contains("photo") || !j["photo"].is_array()) {
        throw CatalogUnavailable("catalog has no \"photo\" array: " + source);
    }

    std::vector<Record> records;
    records.reserve(j["photo"].size());
    size_t index = 0;
    for (const auto& item : j["photo"]) {
        Record r;
        try {
            r = record_from_json(item);
        } catch (const nlohmann::json::exception& e) {
            throw CatalogUnavailable("catalog record " + std::to_string(index) +
                                     " is malformed: " + source + ": " + e.what());
        }
        if (r.id.empty() || r.name.empty()) {
            throw CatalogUnavailable("catalog record " + std::to_string(index) +
                                     " is missing id or name: " + source);
        }
        records.push_back(std::move(r));
        index++;
    }

    auto catalog = std::make_shared<const Catalog>(std::move(records));
    std::cerr << "[catalog] Loaded " << catalog->size() << " records from " << source << "\n";
    return catalog;
}

CatalogRepository::CatalogRepository(std::string path) : path_(std::move(path)) {}

std::shared_ptr<const Catalog> CatalogRepository::snapshot() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cache_) return cache_;

    std::string content;
    if (!read_file(path_, content)) {
        throw CatalogUnavailable("catalog file not found: " + path_);
    }
    cache_ = parse_catalog(content, path_);
    return cache_;
}

std::vector<Record> CatalogRepository::all_records() {
    return snapshot()->records();
}

std::optional<Record> CatalogRepository::by_id(const std::string& id) {
    auto snap = snapshot();
    const Record* r = snap->find(id);
    if (!r) return std::nullopt;
    return *r;
}

std::vector<Record> CatalogRepository::by_location_keyword(const std::set<std::string>& keywords) {
    return snapshot()->by_location_keyword(keywords);
}

void CatalogRepository::invalidate() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.reset();
}

} // namespace kankodori
