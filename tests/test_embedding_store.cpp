#include <catch2/catch_test_macros.hpp>
#include "store/json_embedding_store.hpp"
#include "embedding_repository.hpp"
#include "config.hpp"
#include "mock_collaborators.hpp"
#include <filesystem>

using namespace kankodori;

struct JsonStoreFixture {
    std::string path = temp_path("json_store") + ".json";
    ~JsonStoreFixture() { std::filesystem::remove(path); }
};

// ── JsonEmbeddingStore ───────────────────────────────────────

TEST_CASE_METHOD(JsonStoreFixture, "JsonEmbeddingStore: loads id to vector map", "[store]") {
    atomic_write_file(path, R"({"p1": [1.0, 0.0], "p2": [0.5, 0.5]})");
    JsonEmbeddingStore store(path);

    auto map = store.load();
    REQUIRE(map.size() == 2);
    REQUIRE(map.at("p1") == Embedding{1.0f, 0.0f});
    REQUIRE(map.at("p2").size() == 2);
}

TEST_CASE_METHOD(JsonStoreFixture, "JsonEmbeddingStore: missing file is unavailable", "[store]") {
    JsonEmbeddingStore store(path);
    REQUIRE_THROWS_AS(store.load(), StoreUnavailable);
}

TEST_CASE_METHOD(JsonStoreFixture, "JsonEmbeddingStore: corrupt file is unavailable", "[store]") {
    atomic_write_file(path, "{\"p1\": [1.0, ");
    JsonEmbeddingStore store(path);
    REQUIRE_THROWS_AS(store.load(), StoreUnavailable);
}

TEST_CASE_METHOD(JsonStoreFixture, "JsonEmbeddingStore: non-numeric element is unavailable", "[store]") {
    atomic_write_file(path, R"({"p1": [1.0, "x"]})");
    JsonEmbeddingStore store(path);
    REQUIRE_THROWS_AS(store.load(), StoreUnavailable);
}

TEST_CASE_METHOD(JsonStoreFixture, "JsonEmbeddingStore: mixed vector lengths are unavailable", "[store]") {
    atomic_write_file(path, R"({"p1": [1.0, 0.0], "p2": [1.0, 0.0, 0.0]})");
    JsonEmbeddingStore store(path);
    REQUIRE_THROWS_AS(store.load(), StoreUnavailable);
}

TEST_CASE_METHOD(JsonStoreFixture, "JsonEmbeddingStore: empty vectors are unavailable in any order", "[store]") {
    const char* docs[] = {
        R"({"p1": [], "p2": [1.0]})",
        R"({"p1": [1.0], "p2": []})",
        R"({"p1": [], "p2": []})",
    };
    for (const char* doc : docs) {
        REQUIRE(atomic_write_file(path, doc));
        JsonEmbeddingStore store(path);
        REQUIRE_THROWS_AS(store.load(), StoreUnavailable);
    }
}

TEST_CASE_METHOD(JsonStoreFixture, "JsonEmbeddingStore: put creates and extends the file", "[store]") {
    JsonEmbeddingStore store(path);
    REQUIRE(store.put("p1", {1.0f, 0.0f}));
    REQUIRE(store.put("p2", {0.0f, 1.0f}));
    REQUIRE(store.put("p1", {0.5f, 0.5f}));

    auto map = store.load();
    REQUIRE(map.size() == 2);
    REQUIRE(map.at("p1") == Embedding{0.5f, 0.5f});
}

TEST_CASE_METHOD(JsonStoreFixture, "JsonEmbeddingStore: put rejects a dimension change", "[store]") {
    JsonEmbeddingStore store(path);
    REQUIRE(store.put("p1", {1.0f, 0.0f}));
    REQUIRE_FALSE(store.put("p2", {1.0f, 0.0f, 0.0f}));
    REQUIRE(store.load().size() == 1);
}

TEST_CASE_METHOD(JsonStoreFixture, "JsonEmbeddingStore: put rejects an empty vector", "[store]") {
    JsonEmbeddingStore store(path);
    REQUIRE_FALSE(store.put("p1", {}));
    REQUIRE_FALSE(std::filesystem::exists(path));
}

TEST_CASE_METHOD(JsonStoreFixture, "JsonEmbeddingStore: put leaves a corrupt file alone", "[store]") {
    atomic_write_file(path, "garbage");
    JsonEmbeddingStore store(path);
    REQUIRE_FALSE(store.put("p1", {1.0f}));

    std::string content;
    REQUIRE(read_file(path, content));
    REQUIRE(content == "garbage");
}

// ── validate_dimensions / factory ────────────────────────────

TEST_CASE("validate_dimensions: accepts uniform and empty maps", "[store]") {
    REQUIRE_NOTHROW(validate_dimensions({}, "empty"));
    REQUIRE_NOTHROW(validate_dimensions({{"a", {1.0f, 2.0f}}, {"b", {3.0f, 4.0f}}}, "ok"));
}

TEST_CASE("validate_dimensions: an empty vector is corrupt wherever it sorts", "[store]") {
    REQUIRE_THROWS_AS(validate_dimensions({{"a", {}}, {"b", {1.0f}}}, "first"), StoreUnavailable);
    REQUIRE_THROWS_AS(validate_dimensions({{"a", {1.0f}}, {"b", {}}}, "last"), StoreUnavailable);
    REQUIRE_THROWS_AS(validate_dimensions({{"a", {}}}, "only"), StoreUnavailable);
}

TEST_CASE("create_embedding_store: json backend", "[store]") {
    Config cfg;
    cfg.store_backend = "json";
    auto store = create_embedding_store(cfg, Modality::Text);
    REQUIRE(store != nullptr);
    REQUIRE(store->backend_name() == "json");
}

TEST_CASE("create_embedding_store: unknown backend throws", "[store]") {
    Config cfg;
    cfg.store_backend = "cassandra";
    REQUIRE_THROWS_AS(create_embedding_store(cfg, Modality::Image), std::invalid_argument);
}

// ── EmbeddingRepository ──────────────────────────────────────

TEST_CASE("EmbeddingRepository: map is loaded once and shared", "[store]") {
    auto text = std::make_unique<MapEmbeddingStore>(EmbeddingMap{{"p1", {1.0f, 0.0f}}});
    auto* text_raw = text.get();
    EmbeddingRepository repo(std::move(text),
                             std::make_unique<MapEmbeddingStore>(EmbeddingMap{}));

    auto first = repo.all_vectors(Modality::Text);
    auto second = repo.all_vectors(Modality::Text);
    REQUIRE(first == second);
    REQUIRE(text_raw->load_count == 1);
    REQUIRE(first->size() == 1);
}

TEST_CASE("EmbeddingRepository: modalities are independent", "[store]") {
    EmbeddingRepository repo(
        std::make_unique<MapEmbeddingStore>(EmbeddingMap{{"p1", {1.0f, 0.0f}}}),
        std::make_unique<MapEmbeddingStore>(EmbeddingMap{{"p2", {0.0f, 1.0f}}, {"p3", {1.0f, 1.0f}}}));

    REQUIRE(repo.all_vectors(Modality::Text)->size() == 1);
    REQUIRE(repo.all_vectors(Modality::Image)->size() == 2);
}

TEST_CASE("EmbeddingRepository: vector_for", "[store]") {
    EmbeddingRepository repo(
        std::make_unique<MapEmbeddingStore>(EmbeddingMap{{"p1", {1.0f, 0.0f}}}),
        std::make_unique<MapEmbeddingStore>(EmbeddingMap{}));

    auto v = repo.vector_for(Modality::Text, "p1");
    REQUIRE(v.has_value());
    REQUIRE(v.value_or(Embedding{}) == Embedding{1.0f, 0.0f});
    REQUIRE_FALSE(repo.vector_for(Modality::Text, "p2").has_value());
    REQUIRE_FALSE(repo.vector_for(Modality::Image, "p1").has_value());
}

TEST_CASE("EmbeddingRepository: failed load is retried", "[store]") {
    auto image = std::make_unique<MapEmbeddingStore>(EmbeddingMap{{"p1", {1.0f}}});
    auto* image_raw = image.get();
    image_raw->fail = true;
    EmbeddingRepository repo(std::make_unique<MapEmbeddingStore>(EmbeddingMap{}), std::move(image));

    REQUIRE_THROWS_AS(repo.all_vectors(Modality::Image), StoreUnavailable);

    image_raw->fail = false;
    REQUIRE(repo.all_vectors(Modality::Image)->size() == 1);
    REQUIRE(image_raw->load_count == 2);
}

TEST_CASE("EmbeddingRepository: reload goes back to the store", "[store]") {
    auto text = std::make_unique<MapEmbeddingStore>(EmbeddingMap{{"p1", {1.0f}}});
    auto* text_raw = text.get();
    EmbeddingRepository repo(std::move(text), std::make_unique<MapEmbeddingStore>(EmbeddingMap{}));

    auto before = repo.all_vectors(Modality::Text);
    text_raw->put("p2", {0.5f});
    REQUIRE(repo.all_vectors(Modality::Text)->size() == 1);

    repo.reload(Modality::Text);
    REQUIRE(repo.all_vectors(Modality::Text)->size() == 2);
    REQUIRE(before->size() == 1);
    REQUIRE(text_raw->load_count == 2);
}

TEST_CASE("EmbeddingRepository: missing store is unavailable", "[store]") {
    EmbeddingRepository repo(std::make_unique<MapEmbeddingStore>(EmbeddingMap{}), nullptr);
    REQUIRE_THROWS_AS(repo.all_vectors(Modality::Image), StoreUnavailable);
}
