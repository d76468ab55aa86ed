#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace kankodori {

nlohmann::json Config::defaults_json() {
    Config d;
    return {
        {"paths", {
            {"catalog", d.paths.catalog},
            {"text_embeddings", d.paths.text_embeddings},
            {"image_embeddings", d.paths.image_embeddings},
            {"query_dir", d.paths.query_dir}
        }},
        {"store", {
            {"backend", d.store_backend}
        }},
        {"text_encoder", {
            {"base_url", d.text_encoder.base_url},
            {"model", d.text_encoder.model},
            {"endpoint", d.text_encoder.endpoint},
            {"response_path", d.text_encoder.response_path},
            {"dimensions", d.text_encoder.dimensions}
        }},
        {"image_encoder", {
            {"base_url", d.image_encoder.base_url},
            {"model", d.image_encoder.model},
            {"endpoint", d.image_encoder.endpoint},
            {"response_path", d.image_encoder.response_path},
            {"dimensions", d.image_encoder.dimensions}
        }},
        {"keywords", {
            {"analyzer_url", d.keywords.analyzer_url},
            {"mecab_args", d.keywords.mecab_args},
            {"min_length", d.keywords.min_length},
            {"pos", d.keywords.pos}
        }},
        {"generator", {
            {"url", d.generator.url},
            {"api_key", d.generator.api_key}
        }},
        {"search", {
            {"max_results", d.search.max_results}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static void read_string(const nlohmann::json& obj, const char* key, std::string& out) {
    if (obj.contains(key) && obj[key].is_string())
        out = obj[key].get<std::string>();
}

static void read_uint(const nlohmann::json& obj, const char* key, uint32_t& out) {
    if (obj.contains(key) && obj[key].is_number_unsigned())
        out = obj[key].get<uint32_t>();
}

static void read_encoder(const nlohmann::json& obj, EncoderConfig& enc) {
    read_string(obj, "base_url", enc.base_url);
    read_string(obj, "model", enc.model);
    read_string(obj, "endpoint", enc.endpoint);
    read_string(obj, "response_path", enc.response_path);
    read_uint(obj, "dimensions", enc.dimensions);
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    if (j.contains("paths") && j["paths"].is_object()) {
        auto& p = j["paths"];
        read_string(p, "catalog", cfg.paths.catalog);
        read_string(p, "text_embeddings", cfg.paths.text_embeddings);
        read_string(p, "image_embeddings", cfg.paths.image_embeddings);
        read_string(p, "query_dir", cfg.paths.query_dir);
    }

    if (j.contains("store") && j["store"].is_object())
        read_string(j["store"], "backend", cfg.store_backend);

    if (j.contains("text_encoder") && j["text_encoder"].is_object())
        read_encoder(j["text_encoder"], cfg.text_encoder);
    if (j.contains("image_encoder") && j["image_encoder"].is_object())
        read_encoder(j["image_encoder"], cfg.image_encoder);

    if (j.contains("keywords") && j["keywords"].is_object()) {
        auto& k = j["keywords"];
        read_string(k, "analyzer_url", cfg.keywords.analyzer_url);
        read_string(k, "mecab_args", cfg.keywords.mecab_args);
        read_uint(k, "min_length", cfg.keywords.min_length);
        if (k.contains("pos") && k["pos"].is_array()) {
            cfg.keywords.pos.clear();
            for (const auto& p : k["pos"]) {
                if (p.is_string()) cfg.keywords.pos.push_back(p.get<std::string>());
            }
        }
    }

    if (j.contains("generator") && j["generator"].is_object()) {
        read_string(j["generator"], "url", cfg.generator.url);
        read_string(j["generator"], "api_key", cfg.generator.api_key);
    }

    if (j.contains("search") && j["search"].is_object())
        read_uint(j["search"], "max_results", cfg.search.max_results);

    return cfg;
}

Config Config::load() {
    std::string config_path = expand_home("~/.kankodori/config.json");
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(config_path, j.dump(4) + "\n")) {
                    std::cerr << "[config] Migrated config with new defaults: "
                              << config_path << "\n";
                }
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed config, using defaults: " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    Config cfg = from_json(j);

    // Environment variables always override config file
    if (const char* v = std::getenv("HUGGING_API_KEY"))
        cfg.generator.api_key = v;
    if (const char* v = std::getenv("KANKODORI_CATALOG"))
        cfg.paths.catalog = v;
    if (const char* v = std::getenv("KANKODORI_TEXT_ENCODER_URL"))
        cfg.text_encoder.base_url = v;
    if (const char* v = std::getenv("KANKODORI_IMAGE_ENCODER_URL"))
        cfg.image_encoder.base_url = v;
    if (const char* v = std::getenv("KANKODORI_ANALYZER_URL"))
        cfg.keywords.analyzer_url = v;

    return cfg;
}

std::string Config::embeddings_path(Modality m) const {
    return expand_home(m == Modality::Text ? paths.text_embeddings : paths.image_embeddings);
}

} // namespace kankodori
