#include <tabula/core/blob.hpp>
#include <tabula/core/error.hpp>
#include <tabula/table/table.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace tabula;

namespace {

auto left_table() -> Table {
    return Table({"id", "mz"}, {Type::integer(), Type::floating()}, {"%d", "%.5f"},
                 {{1, 100.0}, {2, 200.0}, {3, 300.0}}, "left");
}

auto right_table() -> Table {
    return Table({"id", "name"}, {Type::integer(), Type::string()}, {"%d", "%s"},
                 {{1, "one"}, {3, "three"}, {3, "drei"}}, "right");
}

}  // namespace

TEST_CASE("join without condition is the cross product", "[table][join]") {
    auto l = left_table();
    auto r = right_table();
    auto j = l.join(r);

    REQUIRE(j.size() == l.size() * r.size());
    REQUIRE(j.column_names() == std::vector<std::string>{"id", "mz", "id__0", "name__0"});
    REQUIRE(j.col_type("name__0") == Type::string());
    REQUIRE(j.col_format("mz") == "%.5f");
    REQUIRE(j.title() == "left vs right");
    REQUIRE(j.row(0) == Row{1, 100.0, 1, "one"});
    REQUIRE(j.row(1) == Row{1, 100.0, 3, "three"});

    SECTION("explicit title") {
        REQUIRE(l.join(r, true, "combined").title() == "combined");
    }

    SECTION("meta of both inputs is kept under their identities") {
        REQUIRE(j.meta().nested(l.ref()) != nullptr);
        REQUIRE(j.meta().nested(r.ref()) != nullptr);
    }

    SECTION("false yields no rows") {
        auto none = l.join(r, false);
        REQUIRE(none.empty());
        REQUIRE(none.num_columns() == 4);
    }
}

TEST_CASE("join on a condition", "[table][join]") {
    auto l = left_table();
    auto r = right_table();

    SECTION("equality across tables") {
        auto j = l.join(r, l.column("id") == r.column("id"));
        REQUIRE(j.size() == 3);
        REQUIRE(j.column_values("name__0") == std::vector<Value>{"one", "three", "drei"});
        REQUIRE(j.column_values("id") == std::vector<Value>{1, 3, 3});
    }

    SECTION("conditions on the left table only select whole blocks") {
        auto j = l.join(r, l.column("id") > 1);
        REQUIRE(j.size() == 2 * r.size());
    }

    SECTION("conditions on the right table only") {
        auto j = l.join(r, r.column("name").is_in({"one"}));
        REQUIRE(j.size() == l.size());
    }

    SECTION("combined conditions") {
        auto j = l.join(r, (l.column("id") == r.column("id")) & (l.column("mz") < 200.0));
        REQUIRE(j.size() == 1);
        REQUIRE(j.row(0) == Row{1, 100.0, 1, "one"});
    }
}

TEST_CASE("left_join keeps unmatched rows", "[table][join]") {
    auto l = left_table();
    auto r = right_table();

    SECTION("with condition") {
        auto j = l.left_join(r, l.column("id") == r.column("id"));
        REQUIRE(j.size() == 4);
        REQUIRE(j.column_values("id") == std::vector<Value>{1, 2, 3, 3});
        REQUIRE(j.get_value(1, "id__0").is_none());
        REQUIRE(j.get_value(1, "name__0").is_none());
    }

    SECTION("false gives one row per left row with None values") {
        auto j = l.left_join(r, false);
        REQUIRE(j.size() == l.size());
        for (std::size_t i = 0; i < j.size(); ++i) {
            REQUIRE(j.get_value(i, "id__0").is_none());
            REQUIRE(j.get_value(i, "name__0").is_none());
        }
    }

    SECTION("empty right table") {
        auto empty = r.filter(false);
        auto j = l.left_join(empty);
        REQUIRE(j.size() == l.size());
        REQUIRE(l.join(empty).empty());
    }
}

TEST_CASE("join renumbers postfixes", "[table][join][postfix]") {
    auto a = to_table("x", {1});
    auto b = to_table("x", {2});
    auto c = to_table("x", {3});

    auto ab = a.join(b);
    REQUIRE(ab.column_names() == std::vector<std::string>{"x", "x__0"});
    auto abc = ab.join(c);
    REQUIRE(abc.column_names() == std::vector<std::string>{"x", "x__0", "x__1"});
    REQUIRE(abc.row(0) == Row{1, 2, 3});

    auto twice = ab.join(ab.copy());
    REQUIRE(twice.column_names() == std::vector<std::string>{"x", "x__0", "x__1", "x__2"});
}

TEST_CASE("join argument errors", "[table][join]") {
    auto l = left_table();
    auto r = right_table();

    SECTION("self join") {
        REQUIRE_THROWS_AS(l.join(l), ArgumentError);
        REQUIRE(l.join(l.copy()).size() == 9);
    }

    SECTION("columns of a third table") {
        auto third = right_table();
        REQUIRE_THROWS_AS(l.join(r, l.column("id") == third.column("id")), ArgumentError);
    }

    SECTION("object partners") {
        const Object& as_object = r;
        REQUIRE(l.join(as_object).size() == 9);
        REQUIRE(l.left_join(as_object, false).size() == 3);

        Blob blob("data");
        REQUIRE_THROWS_AS(l.join(blob), ArgumentError);
        REQUIRE_THROWS_AS(l.left_join(blob), ArgumentError);
    }
}
