#pragma once
#include "embedding.hpp"
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace kankodori {

struct PathsConfig {
    std::string catalog = "~/.kankodori/data/hakodate_result.json";
    std::string text_embeddings = "~/.kankodori/data/text_features.json";
    std::string image_embeddings = "~/.kankodori/data/image_features.json";
    std::string query_dir = "~/.kankodori/query_wait"; // uploaded and generated query images
};

// HTTP encoder service endpoint (text or image)
struct EncoderConfig {
    std::string base_url = "http://localhost:8500";
    std::string model;
    std::string endpoint;
    std::string response_path = "/embedding"; // JSON pointer to the float array
    uint32_t dimensions = 768;                // length of the zero vector on failure
};

struct KeywordConfig {
    std::string analyzer_url;      // empty = in-process MeCab or token splitter
    std::string mecab_args;        // MeCab tagger options, e.g. "-d /path/to/dic"
    uint32_t min_length = 2;       // in code points
    std::vector<std::string> pos = {"名詞", "形容詞", "動詞", "形容動詞", "形状詞"};
};

struct GeneratorConfig {
    std::string url = "https://api-inference.huggingface.co/models/stabilityai/stable-diffusion-3.5-large-turbo";
    std::string api_key;           // empty = generation disabled
};

struct SearchConfig {
    uint32_t max_results = 20;
};

struct Config {
    PathsConfig paths;
    std::string store_backend = "json";
    EncoderConfig text_encoder{"http://localhost:8500", "bert-base-uncased",
                               "/embed/text", "/embedding", 768};
    EncoderConfig image_encoder{"http://localhost:8500", "google/vit-base-patch16-224",
                                "/embed/image", "/embedding", 768};
    KeywordConfig keywords;
    GeneratorConfig generator;
    SearchConfig search;

    // Load from ~/.kankodori/config.json + env vars
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Apply a parsed config document on top of the defaults.
    // Keys that are missing or have the wrong type keep their default.
    static Config from_json(const nlohmann::json& j);

    // Embedding store location for a modality (~ expanded)
    std::string embeddings_path(Modality m) const;
};

} // namespace kankodori
