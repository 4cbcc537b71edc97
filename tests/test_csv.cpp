#include <tabula/core/error.hpp>
#include <tabula/io/csv.hpp>
#include <tabula/table/table.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

using namespace tabula;

namespace {

void write_csv(const std::filesystem::path& path, const char* content) {
    std::ofstream out(path);
    out << content;
}

auto read_text(const std::filesystem::path& path) -> std::string {
    std::ifstream in(path);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

auto tmp(const char* name) -> std::filesystem::path {
    return std::filesystem::temp_directory_path() / name;
}

}  // namespace

TEST_CASE("best_convert picks the narrowest type", "[io][csv]") {
    REQUIRE(io::best_convert("42").is_int());
    REQUIRE(io::best_convert("-7").as_int() == -7);
    REQUIRE(io::best_convert("2.5").as_float() == Catch::Approx(2.5));
    REQUIRE(io::best_convert("1e3").as_float() == Catch::Approx(1000.0));
    REQUIRE(io::best_convert("2,5").as_float() == Catch::Approx(2.5));
    REQUIRE(io::best_convert("abc").as_string() == "abc");
    REQUIRE(io::best_convert("").as_string().empty());
}

TEST_CASE("load_csv converts columns", "[io][csv]") {
    auto path = tmp("tabula_test_load.csv");
    write_csv(path,
              "id; mz value; name; rt\n"
              "1; 100,5; alpha; 30\n"
              "2; 200.25; None; 60.5\n"
              "3; None; gamma; 90\n");

    auto t = io::load_csv(path);
    REQUIRE(t.column_names() == std::vector<std::string>{"id", "mz_value", "name", "rt"});
    REQUIRE(t.size() == 3);
    REQUIRE(t.title() == "tabula_test_load.csv");
    REQUIRE(t.meta().value(std::string("loaded_from")) ==
            Value(std::filesystem::absolute(path).string()));

    REQUIRE(t.col_type("id") == Type::integer());
    REQUIRE(t.col_format("id") == "%d");
    REQUIRE(t.col_type("mz_value") == Type::floating());
    REQUIRE(t.col_format("mz_value") == "%.5f");
    REQUIRE(t.get_value(0, "mz_value").as_float() == Catch::Approx(100.5));
    REQUIRE(t.get_value(2, "mz_value").is_none());
    REQUIRE(t.col_type("name") == Type::string());
    REQUIRE(t.get_value(1, "name").is_none());
    REQUIRE(t.col_type("rt") == Type::floating());
    REQUIRE(t.get_value(0, "rt").is_float());
    REQUIRE(t.col_format("rt") == "@minutes");

    SECTION("keep None strings") {
        auto kept = io::load_csv(path, io::CsvOptions{.keep_none = true});
        REQUIRE(kept.get_value(1, "name") == Value("None"));
        REQUIRE(kept.col_type("mz_value") == Type::any());
    }

    SECTION("format overrides") {
        auto custom = io::load_csv(path, io::CsvOptions{.formats = {{"id", std::nullopt},
                                                                    {"rt", "%.1f"}}});
        REQUIRE(custom.visible_column_names() ==
                std::vector<std::string>{"mz_value", "name", "rt"});
        REQUIRE(custom.col_format("rt") == "%.1f");
    }

    std::filesystem::remove(path);
}

TEST_CASE("load_csv with other separators", "[io][csv]") {
    auto path = tmp("tabula_test_comma.csv");
    write_csv(path, "a,b\n1,x\n2,y\n");
    auto t = io::load_csv(path, io::CsvOptions{.separator = ','});
    REQUIRE(t.column_names() == std::vector<std::string>{"a", "b"});
    REQUIRE(t.column_values("a") == std::vector<Value>{1, 2});
    std::filesystem::remove(path);
}

TEST_CASE("load_csv pads short rows", "[io][csv]") {
    auto path = tmp("tabula_test_ragged.csv");
    write_csv(path, "a;b;c\n1;2;3\n4;5\n");
    auto t = io::load_csv(path);
    REQUIRE(t.size() == 2);
    REQUIRE(t.get_value(1, "c").is_none());
    std::filesystem::remove(path);
}

TEST_CASE("load_csv of a missing file", "[io][csv]") {
    REQUIRE_THROWS_AS(io::load_csv(tmp("tabula_test_does_not_exist.csv")), IoError);
}

TEST_CASE("store_csv", "[io][csv]") {
    auto path = tmp("tabula_test_store.csv");
    std::filesystem::remove(path);
    std::filesystem::remove(tmp("tabula_test_store.csv.1"));

    auto t = Table({"a", "b", "hidden"}, {Type::integer(), Type::floating(), Type::string()},
                   {"%d", "%.2f", std::nullopt}, {{1, 2.5, "x"}, {2, Value(), "y"}});

    auto written = io::store_csv(t, path);
    REQUIRE(written.string() == path.string());
    REQUIRE(read_text(path) == "a; b\n1; 2.5\n2; None\n");

    SECTION("existing files are not overwritten") {
        auto second = io::store_csv(t, path, false);
        REQUIRE(second.string() == tmp("tabula_test_store.csv.1").string());
        REQUIRE(read_text(second) == "a; b; hidden\n1; 2.5; x\n2; None; y\n");
        std::filesystem::remove(second);
    }

    SECTION("written files load again") {
        auto loaded = io::load_csv(path);
        REQUIRE(loaded.column_values("a") == std::vector<Value>{1, 2});
        REQUIRE(loaded.get_value(1, "b").is_none());
    }

    SECTION("extension is checked") {
        REQUIRE_THROWS_AS(io::store_csv(t, tmp("tabula_test_store.txt")), ArgumentError);
        auto upper = tmp("tabula_test_store_upper.CSV");
        std::filesystem::remove(upper);
        REQUIRE(io::store_csv(t, upper).string() == upper.string());
        std::filesystem::remove(upper);
    }

    std::filesystem::remove(path);
}
