#include <tabula/core/error.hpp>
#include <tabula/table/table.hpp>

#include <catch2/catch_test_macros.hpp>

#include <vector>

using namespace tabula;

TEST_CASE("filter with constant conditions", "[table][filter]") {
    auto t = to_table("a", {1, 2, 3}, {}, "numbers");

    auto all = t.filter(true);
    REQUIRE(all.size() == 3);
    REQUIRE(all.title() == "numbers");
    REQUIRE(all.column_names() == t.column_names());

    auto none = t.filter(false);
    REQUIRE(none.empty());
    REQUIRE(none.column_names() == t.column_names());
    REQUIRE(none.col_type("a") == Type::integer());
}

TEST_CASE("filter with column conditions", "[table][filter]") {
    auto t = to_table("a", {1, 2, 3});
    auto a = t.column("a");

    auto kept = t.filter(a >= 2);
    REQUIRE(kept.column_values("a") == std::vector<Value>{2, 3});
    REQUIRE(t.size() == 3);

    SECTION("the result is a new table") {
        REQUIRE(kept.ref() != t.ref());
        kept.set_value(0, "a", 20);
        REQUIRE(t.get_value(1, "a") == Value(2));
    }

    SECTION("conditions combine") {
        REQUIRE(t.filter((a > 1) & (a < 3)).column_values("a") == std::vector<Value>{2});
        REQUIRE(t.filter((a < 2) | (a > 2)).column_values("a") == std::vector<Value>{1, 3});
        REQUIRE(t.filter(!(a == 2)).size() == 2);
    }

    SECTION("arithmetic inside conditions") {
        REQUIRE(t.filter(a * 2 - 1 == 3).column_values("a") == std::vector<Value>{2});
    }
}

TEST_CASE("filter rejects columns of other tables", "[table][filter]") {
    auto t = to_table("a", {1, 2, 3});
    auto other = to_table("a", {1, 2, 3});
    REQUIRE_THROWS_AS(t.filter(other.column("a") > 1), ArgumentError);

    auto copy = t.copy();
    REQUIRE_THROWS_AS(copy.filter(t.column("a") > 1), ArgumentError);
}

TEST_CASE("filter reports evaluation failures", "[table][filter]") {
    auto t = to_table("s", {"x", "y"});
    REQUIRE_THROWS_AS(t.filter(t.column("s") * 2 > 1), ArgumentError);
}

TEST_CASE("filter keeps the primary index", "[table][filter]") {
    auto t = to_table("a", {3, 1, 2});
    t.sort_by({"a"});
    auto kept = t.filter(t.column("a") > 1);
    REQUIRE(kept.primary_index() == "a");
    REQUIRE(kept.column_values("a") == std::vector<Value>{2, 3});
}
