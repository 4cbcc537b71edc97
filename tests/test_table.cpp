#include <tabula/core/error.hpp>
#include <tabula/table/table.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <string>
#include <vector>

using namespace tabula;

namespace {

auto make_table() -> Table {
    return Table({"a", "b", "c"}, {Type::integer(), Type::floating(), Type::string()},
                 {"%d", "%.2f", "%s"}, {{1, 1.5, "x"}, {2, 2.5, "y"}, {3, Value(), "z"}}, "abc");
}

auto ints(const Table& t, const std::string& name) -> std::vector<std::int64_t> {
    std::vector<std::int64_t> out;
    for (const auto& v : t.column_values(name)) {
        out.push_back(v.as_int());
    }
    return out;
}

}  // namespace

TEST_CASE("Table construction", "[table]") {
    auto t = make_table();
    REQUIRE(t.size() == 3);
    REQUIRE(t.num_columns() == 3);
    REQUIRE(t.title() == "abc");
    REQUIRE(t.col_type("b") == Type::floating());
    REQUIRE(t.to_string() == "<Table 'abc' with 3 rows>");

    SECTION("double underscore names are rejected by the constructor") {
        REQUIRE_THROWS_AS(Table({"a__0"}, {Type::integer()}, {"%d"}), SchemaError);
        REQUIRE_NOTHROW(Table::create({"a__0"}, {Type::integer()}, {"%d"}));
    }

    SECTION("rows must match the column count") {
        REQUIRE_THROWS_AS(Table({"a"}, {Type::integer()}, {"%d"}, {{1, 2}}), ShapeMismatch);
    }

    SECTION("empty formats hide columns") {
        Table hidden({"a", "b"}, {Type::integer(), Type::integer()}, {"%d", ""}, {{1, 2}});
        REQUIRE(hidden.visible_column_names() == std::vector<std::string>{"a"});
        REQUIRE_FALSE(hidden.col_format("b").has_value());
    }
}

TEST_CASE("Table cell access", "[table]") {
    auto t = make_table();
    REQUIRE(t.get_value(1, "c") == Value("y"));
    REQUIRE(t.get_value(2, "b").is_none());
    REQUIRE(t.get_value(0, "missing", Value(-1)) == Value(-1));
    REQUIRE_THROWS_AS(t.get_value(5, "a"), ShapeMismatch);

    auto values = t.get_values(0);
    REQUIRE(values.at("a") == Value(1));
    REQUIRE(values.at("c") == Value("x"));

    SECTION("set_value coerces to the column type") {
        t.set_value(0, "a", Value("7"));
        REQUIRE(t.get_value(0, "a") == Value(7));
        REQUIRE(t.get_value(0, "a").is_int());
        REQUIRE_THROWS_AS(t.set_value(0, "a", Value("seven")), TypeError);
    }

    SECTION("add_row validates before appending") {
        t.add_row({4, 4, "w"});
        REQUIRE(t.size() == 4);
        REQUIRE(t.get_value(3, "b").is_float());
        REQUIRE_THROWS_AS(t.add_row({5, "no float", "v"}), TypeError);
        REQUIRE_THROWS_AS(t.add_row({5, 1.0}), ShapeMismatch);
        REQUIRE(t.size() == 4);
    }

    SECTION("set_row replaces a row") {
        t.set_row(1, {9, 9.5, "q"});
        REQUIRE(ints(t, "a") == std::vector<std::int64_t>{1, 9, 3});
    }
}

TEST_CASE("Table copies are independent", "[table]") {
    auto t = make_table();
    auto c = t.copy();
    REQUIRE(c.rows() == t.rows());
    REQUIRE(c.ref() != t.ref());

    c.set_value(0, "a", Value(100));
    c.add_row({4, 1.0, "n"});
    REQUIRE(ints(t, "a") == std::vector<std::int64_t>{1, 2, 3});
    REQUIRE(ints(c, "a") == std::vector<std::int64_t>{100, 2, 3, 4});
}

TEST_CASE("Table meta", "[table]") {
    auto t = make_table();
    t.set_meta(std::string("source"), Value("test"));
    REQUIRE(t.meta().value(std::string("source")) == Value("test"));
    REQUIRE(t.meta().size() == 1);
}

TEST_CASE("Table info summarizes columns", "[table]") {
    auto t = make_table();
    auto info = t.info();
    REQUIRE(info.find("title=abc") != std::string::npos);
    REQUIRE(info.find("rows=3") != std::string::npos);
    REQUIRE(info.find("  3 diff vals,   1 Nones") != std::string::npos);
    REQUIRE(info.find("with format '%.2f'") != std::string::npos);
}

TEST_CASE("to_table builds a single column table", "[table]") {
    auto t = to_table("a", {1, 2.5, Value()});
    REQUIRE(t.column_names() == std::vector<std::string>{"a"});
    REQUIRE(t.col_type("a") == Type::floating());
    REQUIRE(t.get_value(0, "a").is_float());
    REQUIRE(t.col_format("a") == "%.2f");

    auto mz = to_table("mz", {100, 200});
    REQUIRE(mz.col_format("mz") == "%.5f");
}
