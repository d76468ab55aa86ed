#include "encoder.hpp"
#include "clients/http_encoder.hpp"
#include "config.hpp"

namespace kankodori {

std::unique_ptr<TextEncoder> create_text_encoder(const Config& config, HttpClient& http) {
    return std::make_unique<HttpTextEncoder>(config.text_encoder, http);
}

std::unique_ptr<ImageEncoder> create_image_encoder(const Config& config, HttpClient& http) {
    return std::make_unique<HttpImageEncoder>(config.image_encoder, http);
}

} // namespace kankodori
