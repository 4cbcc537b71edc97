#include <tabula/core/blob.hpp>
#include <tabula/table/table.hpp>

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <string>

using namespace tabula;

namespace {

auto sample() -> Table {
    return Table({"a", "s", "f"}, {Type::integer(), Type::string(), Type::floating()},
                 {"%d", "%s", "%.2f"}, {{1, "x", 0.5}, {2, Value(), 1.5}}, "sample");
}

}  // namespace

TEST_CASE("unique_id depends on content only", "[table][identity]") {
    auto t = sample();
    auto id = t.unique_id();
    REQUIRE(id.size() == 64);
    REQUIRE(id.find_first_not_of("0123456789abcdef") == std::string::npos);

    SECTION("equal content gives equal ids") {
        REQUIRE(sample().unique_id() == id);
        REQUIRE(t.copy().unique_id() == id);
        REQUIRE(t.unique_id() == id);
    }

    SECTION("adding a column changes the id") {
        t.add_column("x", 1);
        REQUIRE(t.unique_id() != id);
    }

    SECTION("changing a cell changes the id") {
        t.set_value(1, "s", "y");
        REQUIRE(t.unique_id() != id);
    }

    SECTION("changing a format changes the id") {
        t.set_col_format("f", "%.3f");
        REQUIRE(t.unique_id() != id);
        t.set_col_format("f", std::nullopt);
        REQUIRE(t.unique_id() != id);
    }

    SECTION("changing meta changes the id") {
        t.set_meta(std::string("origin"), Value("lab"));
        REQUIRE(t.unique_id() != id);
    }

    SECTION("int and float cells hash differently") {
        auto ints = to_table("v", {1, 2});
        auto floats = to_table("v", {1.0, 2.0});
        floats.set_col_type("v", Type::integer());
        floats.set_col_format("v", "%d");
        REQUIRE(ints.unique_id() != floats.unique_id());
    }

    SECTION("the id is cached in meta") {
        REQUIRE(t.meta().value(std::string("unique_id")) == Value(id));
        t.add_row({3, "z", 2.5});
        REQUIRE_FALSE(t.meta().contains(std::string("unique_id")));
    }
}

TEST_CASE("unique_id of nested objects", "[table][identity]") {
    auto make = [](const std::string& payload) {
        return Table({"blob"}, {Type::blob()}, {"%r"}, {{Blob::make(payload, "PNG")}});
    };
    REQUIRE(make("abc").unique_id() == make("abc").unique_id());
    REQUIRE(make("abc").unique_id() != make("abd").unique_id());

    auto inner = std::make_shared<const Table>(sample());
    auto outer = Table({"t"}, {Type::table()}, {"%s"}, {{inner}});
    auto id = outer.unique_id();
    auto changed = sample();
    changed.set_value(0, "a", 10);
    auto other = Table({"t"}, {Type::table()}, {"%s"}, {{std::make_shared<const Table>(changed)}});
    REQUIRE(other.unique_id() != id);
}

TEST_CASE("Table equality", "[table][identity]") {
    auto t = sample();
    REQUIRE(t.equals(sample()));
    REQUIRE(t.equals(t));

    auto retitled = sample();
    retitled.set_title("other");
    REQUIRE_FALSE(t.equals(retitled));

    auto blob = Blob("x");
    REQUIRE_FALSE(t.equals(blob));
    REQUIRE(Value(std::make_shared<const Table>(sample())) ==
            Value(std::make_shared<const Table>(sample())));
}

TEST_CASE("Nested tables differing only in meta group together", "[table][identity]") {
    auto plain = std::make_shared<const Table>(sample());
    auto annotated = sample();
    annotated.set_meta(std::string("source"), Value("run 7"));
    auto tagged = std::make_shared<const Table>(std::move(annotated));

    REQUIRE(Value(plain) == Value(tagged));
    REQUIRE(plain->unique_id() != tagged->unique_id());
    REQUIRE(ValueHash{}(Value(plain)) == ValueHash{}(Value(tagged)));

    auto outer = Table({"t", "n"}, {Type::table(), Type::integer()}, {"%s", "%d"},
                       {{plain, 1}, {tagged, 1}});
    REQUIRE(outer.unique_rows().size() == 1);
    REQUIRE(outer.split_by({"t"}).size() == 1);

    auto blobs = Table({"b"}, {Type::blob()}, {"%r"},
                       {{Blob::make("same", "PNG")}, {Blob::make("same", "PNG")},
                        {Blob::make("same", "JPG")}});
    REQUIRE(blobs.unique_rows().size() == 2);
}

TEST_CASE("unique_id of join results ignores construction order", "[table][identity][join]") {
    auto make_left = [] {
        auto t = Table({"a"}, {Type::integer()}, {"%d"}, {{1}, {2}}, "left");
        t.set_meta(std::string("side"), Value("L"));
        return t;
    };
    auto make_right = [] {
        auto t = Table({"b"}, {Type::string()}, {"%s"}, {{"x"}}, "right");
        t.set_meta(std::string("side"), Value("R"));
        return t;
    };

    auto l1 = make_left();
    auto r1 = make_right();
    auto r2 = make_right();
    auto l2 = make_left();

    auto j1 = l1.join(r1);
    auto j2 = l2.join(r2);
    REQUIRE(j1.equals(j2));
    REQUIRE(j1.unique_id() == j2.unique_id());

    auto r3 = make_right();
    r3.set_meta(std::string("side"), Value("other"));
    REQUIRE(l1.join(r3).unique_id() != j1.unique_id());
}

TEST_CASE("compress_objects shares identical objects", "[table][identity]") {
    auto t = Table({"blob"}, {Type::blob()}, {"%r"},
                   {{Blob::make("same")}, {Blob::make("same")}, {Blob::make("different")}});
    REQUIRE(t.get_value(0, "blob").as_object() != t.get_value(1, "blob").as_object());
    auto id = t.unique_id();

    t.compress_objects();
    REQUIRE(t.get_value(0, "blob").as_object() == t.get_value(1, "blob").as_object());
    REQUIRE(t.get_value(0, "blob").as_object() != t.get_value(2, "blob").as_object());
    REQUIRE(t.unique_id() == id);
}
