#include "catalog.hpp"
#include "config.hpp"
#include "embedding_repository.hpp"
#include "encoder.hpp"
#include "fusion.hpp"
#include "http.hpp"
#include "image_generator.hpp"
#include "keywords.hpp"
#include "search_service.hpp"
#include "store/embedding_store.hpp"
#include "util.hpp"
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

static void print_usage() {
    std::cout << "Usage: kankodori [options]\n"
              << "\n"
              << "Recommend tourist spots for a text query, an image, or both.\n"
              << "\n"
              << "Options:\n"
              << "  -w, --weight N       Image weight 0..100 (0 = text only, 100 = image only, default 0)\n"
              << "  -t, --text TEXT      Query text (\"null\" = none, default)\n"
              << "  -i, --image FILE     Query image, relative to the query directory (\"null\" = none, default)\n"
              << "  -n, --limit N        Maximum number of results (default: search.max_results)\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  KANKODORI_CATALOG            Catalog JSON file\n"
              << "  KANKODORI_TEXT_ENCODER_URL   Text embedding service base URL\n"
              << "  KANKODORI_IMAGE_ENCODER_URL  Image embedding service base URL\n"
              << "  KANKODORI_ANALYZER_URL       Morphological analyzer endpoint\n"
              << "  HUGGING_API_KEY              Enables text-to-image query generation\n";
}

int main(int argc, char* argv[]) try {
    // Parse arguments
    int weight = 0;
    int limit = -1;
    std::string text = kankodori::kNullArg;
    std::string image = kankodori::kNullArg;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if ((std::strcmp(argv[i], "-w") == 0 || std::strcmp(argv[i], "--weight") == 0) && i + 1 < argc) {
            if (!kankodori::parse_int(argv[++i], weight)) {
                std::cerr << "Invalid weight: " << argv[i] << "\n";
                return 1;
            }
        } else if ((std::strcmp(argv[i], "-t") == 0 || std::strcmp(argv[i], "--text") == 0) && i + 1 < argc) {
            text = argv[++i];
        } else if ((std::strcmp(argv[i], "-i") == 0 || std::strcmp(argv[i], "--image") == 0) && i + 1 < argc) {
            image = argv[++i];
        } else if ((std::strcmp(argv[i], "-n") == 0 || std::strcmp(argv[i], "--limit") == 0) && i + 1 < argc) {
            if (!kankodori::parse_int(argv[++i], limit) || limit < 0) {
                std::cerr << "Invalid limit: " << argv[i] << "\n";
                return 1;
            }
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    // Initialize
    kankodori::http_init();
    auto config = kankodori::Config::load();
    if (limit >= 0) config.search.max_results = static_cast<uint32_t>(limit);

    kankodori::CurlHttpClient http_client;

    // Composition root: every collaborator is built here and injected
    kankodori::CatalogRepository catalog(kankodori::expand_home(config.paths.catalog));
    kankodori::EmbeddingRepository embeddings(
        kankodori::create_embedding_store(config, kankodori::Modality::Text),
        kankodori::create_embedding_store(config, kankodori::Modality::Image));
    auto extractor = kankodori::create_keyword_extractor(config.keywords, http_client);
    auto text_encoder = kankodori::create_text_encoder(config, http_client);
    auto image_encoder = kankodori::create_image_encoder(config, http_client);
    auto generator = kankodori::create_image_generator(config, http_client);

    kankodori::FusionEngine engine(catalog, embeddings, *extractor, *text_encoder);
    kankodori::SearchService service(engine, *image_encoder, generator.get(),
                                     kankodori::expand_home(config.paths.query_dir),
                                     config.search.max_results);

    int status = 0;
    try {
        auto response = service.search(weight, text, image);
        std::cout << response.to_json().dump(2) << "\n";
    } catch (const kankodori::CatalogUnavailable& e) {
        std::cerr << "Error: catalog unavailable: " << e.what() << "\n";
        status = 1;
    }

    kankodori::http_cleanup();
    return status;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
