#include "json_embedding_store.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>

namespace kankodori {

JsonEmbeddingStore::JsonEmbeddingStore(std::string path) : path_(std::move(path)) {}

EmbeddingMap JsonEmbeddingStore::read_file_locked() {
    std::string content;
    if (!read_file(path_, content)) {
        throw StoreUnavailable("embedding file not found: " + path_);
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw StoreUnavailable("embedding file is not valid JSON: " + path_ + ": " + e.what());
    }
    if (!j.is_object()) {
        throw StoreUnavailable("embedding file is not an object: " + path_);
    }

    EmbeddingMap map;
    map.reserve(j.size());
    for (auto& [id, arr] : j.items()) {
        if (!arr.is_array()) {
            throw StoreUnavailable("embedding for '" + id + "' is not an array: " + path_);
        }
        Embedding vec;
        vec.reserve(arr.size());
        for (const auto& v : arr) {
            if (!v.is_number()) {
                throw StoreUnavailable("non-numeric value in embedding '" + id + "': " + path_);
            }
            vec.push_back(v.get<float>());
        }
        map.emplace(id, std::move(vec));
    }
    validate_dimensions(map, path_);
    return map;
}

EmbeddingMap JsonEmbeddingStore::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    return read_file_locked();
}

bool JsonEmbeddingStore::put(const std::string& id, const Embedding& vector) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (vector.empty()) return false;

    EmbeddingMap map;
    if (std::filesystem::exists(path_)) {
        try {
            map = read_file_locked();
        } catch (const StoreUnavailable&) {
            // Never overwrite a file we could not understand
            return false;
        }
    }
    if (!map.empty() && map.begin()->second.size() != vector.size()) return false;

    map[id] = vector;

    nlohmann::json j = nlohmann::json::object();
    for (const auto& [key, vec] : map) {
        j[key] = vec;
    }
    return atomic_write_file(path_, j.dump());
}

} // namespace kankodori
