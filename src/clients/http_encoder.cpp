#include "http_encoder.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

namespace kankodori {

Embedding parse_embedding_response(const HttpResponse& response,
                                   const std::string& response_path) {
    if (response.status_code < 200 || response.status_code >= 300) {
        return {};
    }

    try {
        auto j = nlohmann::json::parse(response.body);
        const auto& arr = j.at(nlohmann::json::json_pointer(response_path));
        if (!arr.is_array()) return {};
        Embedding result;
        result.reserve(arr.size());
        for (const auto& val : arr) {
            result.push_back(val.get<float>());
        }
        return result;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[encoder] Malformed embedding response: " << e.what() << "\n";
        return {};
    }
}

HttpTextEncoder::HttpTextEncoder(EncoderConfig config, HttpClient& http)
    : config_(std::move(config)), http_(http) {}

Embedding HttpTextEncoder::encode(const std::string& text) {
    Embedding zero(config_.dimensions, 0.0f);
    if (trim(text).empty()) return zero;

    nlohmann::json body = {
        {"model", config_.model},
        {"input", text}
    };
    std::vector<Header> headers = {
        {"Content-Type", "application/json"}
    };

    auto response = http_.post(config_.base_url + config_.endpoint, body.dump(), headers, 60);
    Embedding result = parse_embedding_response(response, config_.response_path);
    if (result.empty()) {
        std::cerr << "[encoder] Text encoding failed (HTTP " << response.status_code << ")\n";
        return zero;
    }
    return result;
}

HttpImageEncoder::HttpImageEncoder(EncoderConfig config, HttpClient& http)
    : config_(std::move(config)), http_(http) {}

Embedding HttpImageEncoder::encode(const std::string& image_path) {
    Embedding zero(config_.dimensions, 0.0f);

    std::string bytes;
    if (!read_file(image_path, bytes) || bytes.empty()) {
        std::cerr << "[encoder] Cannot read query image: " << image_path << "\n";
        return zero;
    }

    std::vector<Header> headers = {
        {"Content-Type", "application/octet-stream"},
        {"X-Model", config_.model}
    };

    auto response = http_.post(config_.base_url + config_.endpoint, bytes, headers, 60);
    Embedding result = parse_embedding_response(response, config_.response_path);
    if (result.empty()) {
        std::cerr << "[encoder] Image encoding failed (HTTP " << response.status_code << ")\n";
        return zero;
    }
    return result;
}

} // namespace kankodori
