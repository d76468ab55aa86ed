#include <catch2/catch_test_macros.hpp>
#include "catalog.hpp"
#include "mock_collaborators.hpp"
#include <nlohmann/json.hpp>

using namespace kankodori;

static const std::string kCatalog = catalog_json({
    {"p1", "Mount Hakodate", "函館市元町"},
    {"p2", "Goryokaku", "函館市五稜郭町"},
    {"p3", "Lake Onuma", "七飯町"},
});

// ── Loading ──────────────────────────────────────────────────

TEST_CASE("CatalogRepository: loads records in storage order", "[catalog]") {
    CatalogFile f("catalog_load", kCatalog);
    CatalogRepository repo(f.path);

    auto records = repo.all_records();
    REQUIRE(records.size() == 3);
    REQUIRE(records[0].id == "p1");
    REQUIRE(records[2].name == "Lake Onuma");
}

TEST_CASE("CatalogRepository: missing file throws CatalogUnavailable", "[catalog]") {
    CatalogRepository repo("/nonexistent/kankodori/catalog.json");
    REQUIRE_THROWS_AS(repo.snapshot(), CatalogUnavailable);
    REQUIRE_THROWS_AS(repo.all_records(), CatalogUnavailable);
}

TEST_CASE("CatalogRepository: malformed JSON throws CatalogUnavailable", "[catalog]") {
    CatalogFile f("catalog_bad", "not json {{{");
    CatalogRepository repo(f.path);
    REQUIRE_THROWS_AS(repo.snapshot(), CatalogUnavailable);
}

TEST_CASE("CatalogRepository: document without photo array is rejected", "[catalog]") {
    CatalogFile f("catalog_shape", R"({"spots": []})");
    CatalogRepository repo(f.path);
    REQUIRE_THROWS_AS(repo.snapshot(), CatalogUnavailable);
}

TEST_CASE("CatalogRepository: record without name is rejected", "[catalog]") {
    CatalogFile f("catalog_noname", R"({"photo": [{"id": "p1", "location": "x"}]})");
    CatalogRepository repo(f.path);
    REQUIRE_THROWS_AS(repo.snapshot(), CatalogUnavailable);
}

TEST_CASE("CatalogRepository: empty photo array is a valid catalog", "[catalog]") {
    CatalogFile f("catalog_empty", R"({"photo": []})");
    CatalogRepository repo(f.path);
    REQUIRE(repo.all_records().empty());
}

// ── Lookup ───────────────────────────────────────────────────

TEST_CASE("CatalogRepository: by_id", "[catalog]") {
    CatalogFile f("catalog_byid", kCatalog);
    CatalogRepository repo(f.path);

    auto r = repo.by_id("p2");
    REQUIRE(r.has_value());
    REQUIRE(r.value_or(Record{}).name == "Goryokaku");
    REQUIRE_FALSE(repo.by_id("missing").has_value());
}

TEST_CASE("CatalogRepository: by_location_keyword matches any keyword", "[catalog]") {
    CatalogFile f("catalog_loc", kCatalog);
    CatalogRepository repo(f.path);

    auto hits = repo.by_location_keyword({"五稜郭", "七飯"});
    REQUIRE(hits.size() == 2);
    REQUIRE(hits[0].id == "p2");
    REQUIRE(hits[1].id == "p3");

    REQUIRE(repo.by_location_keyword({"函館"}).size() == 2);
}

TEST_CASE("CatalogRepository: by_location_keyword is case-sensitive", "[catalog]") {
    CatalogFile f("catalog_case", catalog_json({{"a", "A", "Hakodate Bay"}}));
    CatalogRepository repo(f.path);

    REQUIRE(repo.by_location_keyword({"Hakodate"}).size() == 1);
    REQUIRE(repo.by_location_keyword({"hakodate"}).empty());
}

TEST_CASE("CatalogRepository: no match or no keywords returns empty", "[catalog]") {
    CatalogFile f("catalog_nomatch", kCatalog);
    CatalogRepository repo(f.path);

    REQUIRE(repo.by_location_keyword({"札幌"}).empty());
    REQUIRE(repo.by_location_keyword({}).empty());
}

// ── Snapshots ────────────────────────────────────────────────

TEST_CASE("CatalogRepository: invalidate reloads, old snapshot stays intact", "[catalog]") {
    CatalogFile f("catalog_reload", kCatalog);
    CatalogRepository repo(f.path);

    auto before = repo.snapshot();
    REQUIRE(before->size() == 3);

    atomic_write_file(f.path, catalog_json({{"p9", "New Spot", "函館市"}}));

    // Still cached until invalidated
    REQUIRE(repo.snapshot()->size() == 3);

    repo.invalidate();
    auto after = repo.snapshot();
    REQUIRE(after->size() == 1);
    REQUIRE(after->find("p9") != nullptr);

    // A search holding the old snapshot sees a consistent pre-append view
    REQUIRE(before->size() == 3);
    REQUIRE(before->find("p9") == nullptr);
}

// ── Record JSON ──────────────────────────────────────────────

TEST_CASE("record_from_json: reads nested description and extra text fields", "[catalog]") {
    auto item = nlohmann::json::parse(R"({
        "id": "p1", "name": "Red Brick Warehouse", "location": "函館市末広町",
        "tag": ["port", "shopping"], "explain": "Warehouses by the bay",
        "description": {"_content": "Long description"},
        "season": "winter", "views": 12
    })");

    Record r = record_from_json(item);
    REQUIRE(r.id == "p1");
    REQUIRE(r.tag == "port,shopping");
    REQUIRE(r.description == "Long description");
    REQUIRE(r.extra_fields.count("season") == 1);
    REQUIRE(r.extra_fields.count("views") == 1);

    auto out = record_to_json(r);
    REQUIRE(out["description"]["_content"] == "Long description");
    REQUIRE(out["season"] == "winter");
    REQUIRE(out["views"] == 12);
}

TEST_CASE("record_to_json: non-string catalog values keep their JSON type", "[catalog]") {
    auto item = nlohmann::json::parse(R"({
        "id": "p1", "name": "Hachiman-zaka", "location": "函館市元町",
        "tag": ["slope", "sea"],
        "word": ["坂", "海"],
        "geo": {"lat": 41.76, "lon": 140.71},
        "views": 305
    })");

    Record r = record_from_json(item);
    REQUIRE(r.tag == "slope,sea");

    auto out = record_to_json(r);
    REQUIRE(out["tag"] == nlohmann::json::array({"slope", "sea"}));
    REQUIRE(out["word"] == item["word"]);
    REQUIRE(out["geo"] == item["geo"]);
    REQUIRE(out["views"] == 305);
}

TEST_CASE("record_from_json: non-string description content is tolerated", "[catalog]") {
    for (const char* content : {"null", "7", "{\"x\": 1}"}) {
        auto item = nlohmann::json::parse(
            std::string(R"({"id": "p1", "name": "A", "location": "x", "description": {"_content": )") +
            content + "}}");

        Record r;
        REQUIRE_NOTHROW(r = record_from_json(item));
        REQUIRE(r.description.empty());
        REQUIRE(record_to_json(r)["description"] == item["description"]);
    }
}

TEST_CASE("CatalogRepository: null description content loads", "[catalog]") {
    CatalogFile f("catalog_null_desc",
                  R"({"photo": [{"id": "p1", "name": "A", "location": "函館市",
                                 "description": {"_content": null}}]})");
    CatalogRepository repo(f.path);

    REQUIRE_NOTHROW(repo.snapshot());
    REQUIRE(repo.all_records().size() == 1);
}

TEST_CASE("parse_catalog: corrupt records raise CatalogUnavailable", "[catalog]") {
    const char* docs[] = {
        R"({"photo": [{"id": "p1", "name": "A", "description": {"_content": null}}, 42]})",
        R"({"photo": [{"id": null, "name": "A"}]})",
        R"({"photo": [{"id": "p1", "description": {"_content": 3}}]})",
    };
    for (const char* doc : docs) {
        REQUIRE_THROWS_AS(parse_catalog(doc, "inline"), CatalogUnavailable);
    }
}
