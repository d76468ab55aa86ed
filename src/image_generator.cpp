#include "image_generator.hpp"
#include "config.hpp"
#include "http.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <cstdio>
#include <functional>
#include <iostream>

namespace kankodori {

HttpImageGenerator::HttpImageGenerator(HttpClient& http, std::string url,
                                       std::string api_key, std::string output_dir)
    : http_(http), url_(std::move(url)), api_key_(std::move(api_key)),
      output_dir_(std::move(output_dir)) {}

std::optional<std::string> HttpImageGenerator::generate(const std::string& prompt) {
    if (trim(prompt).empty()) return std::nullopt;

    nlohmann::json body = {{"inputs", prompt}};
    std::vector<Header> headers = {
        {"Authorization", "Bearer " + api_key_},
        {"Content-Type", "application/json"}
    };

    auto response = http_.post(url_, body.dump(), headers, 180);
    if (response.status_code != 200 || response.body.empty()) {
        std::cerr << "[generator] Image generation failed (HTTP "
                  << response.status_code << ")\n";
        return std::nullopt;
    }

    // Prompts are free text; name the file by hash rather than by prompt
    char name[32];
    std::snprintf(name, sizeof(name), "gen_%016zx.jpg", std::hash<std::string>{}(prompt));
    std::string path = output_dir_ + "/" + name;

    if (!atomic_write_file(path, response.body)) {
        std::cerr << "[generator] Cannot write generated image: " << path << "\n";
        return std::nullopt;
    }
    return path;
}

std::unique_ptr<ImageGenerator> create_image_generator(const Config& config, HttpClient& http) {
    if (config.generator.api_key.empty() || config.generator.url.empty()) {
        return nullptr;
    }
    return std::make_unique<HttpImageGenerator>(
        http, config.generator.url, config.generator.api_key,
        expand_home(config.paths.query_dir));
}

} // namespace kankodori
