#pragma once
#include "embedding.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace kankodori {

class HttpClient; // forward declare
struct Config;    // forward declare

// Maps query text to a vector in the text embedding space.
// Never throws: failure or empty input yields dimensions() zeros.
class TextEncoder {
public:
    virtual ~TextEncoder() = default;
    virtual Embedding encode(const std::string& text) = 0;
    virtual uint32_t dimensions() const = 0;
    virtual std::string encoder_name() const = 0;
};

// Maps an image file to a vector in the image embedding space.
// Never throws: an unreadable file or failed call yields dimensions() zeros.
class ImageEncoder {
public:
    virtual ~ImageEncoder() = default;
    virtual Embedding encode(const std::string& image_path) = 0;
    virtual uint32_t dimensions() const = 0;
    virtual std::string encoder_name() const = 0;
};

std::unique_ptr<TextEncoder> create_text_encoder(const Config& config, HttpClient& http);
std::unique_ptr<ImageEncoder> create_image_encoder(const Config& config, HttpClient& http);

} // namespace kankodori
