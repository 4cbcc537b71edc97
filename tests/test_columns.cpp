#include <tabula/core/error.hpp>
#include <tabula/table/columns.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace tabula;

namespace {

auto make_registry() -> ColumnRegistry {
    return ColumnRegistry({"a", "b", "c"}, {Type::integer(), Type::floating(), Type::string()},
                          {"%d", "%.2f", std::nullopt});
}

}  // namespace

TEST_CASE("ColumnRegistry construction checks names", "[table][columns]") {
    SECTION("duplicate names") {
        REQUIRE_THROWS_AS(ColumnRegistry({"a", "a"}, {Type::integer(), Type::integer()},
                                         {"%d", "%d"}),
                          SchemaError);
    }

    SECTION("reserved names") {
        REQUIRE(is_reserved_name("rows"));
        REQUIRE(is_reserved_name("filter"));
        REQUIRE_FALSE(is_reserved_name("mz"));
        for (const auto* member : {"slice", "row_table", "update_column", "set_title", "set_meta",
                                   "version", "equals", "num_columns", "has_column", "col_type"}) {
            REQUIRE(is_reserved_name(member));
        }
        REQUIRE_THROWS_AS(ColumnRegistry({"rows"}, {Type::integer()}, {"%d"}), SchemaError);
    }

    SECTION("length mismatch") {
        REQUIRE_THROWS_AS(ColumnRegistry({"a", "b"}, {Type::integer()}, {"%d", "%d"}),
                          ShapeMismatch);
    }
}

TEST_CASE("ColumnRegistry lookup", "[table][columns]") {
    auto columns = make_registry();
    REQUIRE(columns.size() == 3);
    REQUIRE(columns.index_of("b") == 1);
    REQUIRE(columns.find("x") == std::nullopt);
    REQUIRE(columns.has_columns({"a", "c"}));
    REQUIRE_FALSE(columns.has_columns({"a", "x"}));
    REQUIRE_THROWS_AS(columns.index_of("x"), SchemaError);
    REQUIRE_FALSE(columns.format(2).has_value());

    SECTION("ensure_columns names the missing ones") {
        REQUIRE_NOTHROW(columns.ensure_columns({"a", "b"}));
        try {
            columns.ensure_columns({"a", "x"});
            FAIL("expected SchemaError");
        } catch (const SchemaError& e) {
            REQUIRE(std::string(e.what()) == "expected names a, x, found a but x were missing");
        }
    }
}

TEST_CASE("ColumnRegistry rename is atomic", "[table][columns]") {
    auto columns = make_registry();

    SECTION("plain rename") {
        columns.rename({{"a", "x"}, {"b", "y"}});
        REQUIRE(columns.names() == std::vector<std::string>{"x", "y", "c"});
        REQUIRE(columns.index_of("y") == 1);
    }

    SECTION("new name that exists fails, even when renamed away") {
        REQUIRE_THROWS_AS(columns.rename({{"a", "b"}, {"b", "z"}}), NameCollisionError);
        REQUIRE(columns.names() == std::vector<std::string>{"a", "b", "c"});
    }

    SECTION("unknown column") {
        REQUIRE_THROWS_AS(columns.rename({{"q", "z"}}), SchemaError);
    }

    SECTION("two columns to the same name") {
        REQUIRE_THROWS_AS(columns.rename({{"a", "z"}, {"b", "z"}}), SchemaError);
        REQUIRE(columns.names() == std::vector<std::string>{"a", "b", "c"});
    }

    SECTION("double underscore") {
        REQUIRE_THROWS_AS(columns.rename({{"a", "a__1"}}), SchemaError);
    }
}

TEST_CASE("ColumnRegistry insert and erase", "[table][columns]") {
    auto columns = make_registry();
    columns.insert(1, "n", Type::integer(), "%d");
    REQUIRE(columns.names() == std::vector<std::string>{"a", "n", "b", "c"});
    REQUIRE(columns.index_of("c") == 3);
    REQUIRE_THROWS_AS(columns.insert(0, "a", Type::integer(), "%d"), NameCollisionError);

    columns.erase({0, 2});
    REQUIRE(columns.names() == std::vector<std::string>{"n", "c"});
    REQUIRE(columns.type(1) == Type::string());
}
