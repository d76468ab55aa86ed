#include <catch2/catch_test_macros.hpp>
#include "util.hpp"
#include <cstdlib>
#include <filesystem>
#include <unistd.h>

using namespace kankodori;

TEST_CASE("trim: strips surrounding whitespace", "[util]") {
    REQUIRE(trim("  hello \n") == "hello");
    REQUIRE(trim("   ").empty());
    REQUIRE(trim("").empty());
}

TEST_CASE("utf8_length: counts code points", "[util]") {
    REQUIRE(utf8_length("") == 0);
    REQUIRE(utf8_length("abc") == 3);
    REQUIRE(utf8_length("函館") == 2);
    REQUIRE(utf8_length("函館山 view") == 8);
}

TEST_CASE("parse_int: accepts whole decimal ints only", "[util]") {
    int v = 0;
    REQUIRE(parse_int("75", v));
    REQUIRE(v == 75);
    REQUIRE(parse_int("-3", v));
    REQUIRE(v == -3);
    REQUIRE(parse_int("2147483647", v));
    REQUIRE(v == 2147483647);

    v = 42;
    REQUIRE_FALSE(parse_int("", v));
    REQUIRE_FALSE(parse_int("abc", v));
    REQUIRE_FALSE(parse_int("50%", v));
    REQUIRE(v == 42);
}

TEST_CASE("parse_int: rejects values outside int instead of wrapping", "[util]") {
    int v = 7;
    REQUIRE_FALSE(parse_int("4294967396", v));
    REQUIRE_FALSE(parse_int("4294967295", v));
    REQUIRE_FALSE(parse_int("2147483648", v));
    REQUIRE_FALSE(parse_int("-99999999999", v));
    REQUIRE_FALSE(parse_int("99999999999999999999999", v));
    REQUIRE(v == 7);
}

TEST_CASE("expand_home: replaces leading tilde", "[util]") {
    const char* home = std::getenv("HOME");
    REQUIRE(home != nullptr);
    REQUIRE(expand_home("~/x") == std::string(home) + "/x");
    REQUIRE(expand_home("/abs/x") == "/abs/x");
}

TEST_CASE("atomic_write_file: creates parents and replaces content", "[util]") {
    auto dir = std::filesystem::temp_directory_path() /
               ("kankodori_util_" + std::to_string(getpid()));
    std::string path = (dir / "nested" / "file.txt").string();

    REQUIRE(atomic_write_file(path, "first"));
    REQUIRE(atomic_write_file(path, "second"));

    std::string content;
    REQUIRE(read_file(path, content));
    REQUIRE(content == "second");
    REQUIRE_FALSE(std::filesystem::exists(path + ".tmp"));

    std::filesystem::remove_all(dir);
}

TEST_CASE("read_file: missing file returns false", "[util]") {
    std::string content;
    REQUIRE_FALSE(read_file("/nonexistent/kankodori/file", content));
}
