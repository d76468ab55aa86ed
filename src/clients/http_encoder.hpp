#pragma once
#include "../encoder.hpp"
#include "../config.hpp"
#include "../http.hpp"
#include <string>

namespace kankodori {

// Text encoder backed by an embedding service.
// POST {base_url}{endpoint} with {"model": ..., "input": text}.
class HttpTextEncoder : public TextEncoder {
public:
    HttpTextEncoder(EncoderConfig config, HttpClient& http);

    Embedding encode(const std::string& text) override;
    uint32_t dimensions() const override { return config_.dimensions; }
    std::string encoder_name() const override { return "http:" + config_.model; }

private:
    EncoderConfig config_;
    HttpClient& http_;
};

// Image encoder backed by an embedding service.
// POST {base_url}{endpoint} with the raw file bytes as the body.
class HttpImageEncoder : public ImageEncoder {
public:
    HttpImageEncoder(EncoderConfig config, HttpClient& http);

    Embedding encode(const std::string& image_path) override;
    uint32_t dimensions() const override { return config_.dimensions; }
    std::string encoder_name() const override { return "http:" + config_.model; }

private:
    EncoderConfig config_;
    HttpClient& http_;
};

// Extract the float array at config.response_path from a 2xx response.
// Returns an empty vector on any failure.
Embedding parse_embedding_response(const HttpResponse& response,
                                   const std::string& response_path);

} // namespace kankodori
