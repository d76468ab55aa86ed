#pragma once
#include <memory>
#include <optional>
#include <string>

namespace kankodori {

class HttpClient; // forward declare
struct Config;    // forward declare

// Produces a query image from a text prompt when the caller supplied none.
class ImageGenerator {
public:
    virtual ~ImageGenerator() = default;

    // Path of the written image file, or nullopt on failure. Never throws.
    virtual std::optional<std::string> generate(const std::string& prompt) = 0;
};

// Text-to-image inference endpoint (Hugging Face style): POST
// {"inputs": prompt} with a bearer token, response body is the image.
class HttpImageGenerator : public ImageGenerator {
public:
    HttpImageGenerator(HttpClient& http, std::string url, std::string api_key,
                       std::string output_dir);

    std::optional<std::string> generate(const std::string& prompt) override;

private:
    HttpClient& http_;
    std::string url_;
    std::string api_key_;
    std::string output_dir_;
};

// nullptr when no generator API key is configured.
std::unique_ptr<ImageGenerator> create_image_generator(const Config& config, HttpClient& http);

} // namespace kankodori
