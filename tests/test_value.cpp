#include <tabula/core/blob.hpp>
#include <tabula/core/error.hpp>
#include <tabula/core/postfix.hpp>
#include <tabula/core/value.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

using namespace tabula;

TEST_CASE("Value holds the basic cell types", "[core][value]") {
    SECTION("None") {
        Value v;
        REQUIRE(v.is_none());
        REQUIRE_FALSE(v.truthy());
        REQUIRE(v.to_string() == "None");
    }

    SECTION("integers of any width become int64") {
        Value v(std::uint8_t{7});
        REQUIRE(v.is_int());
        REQUIRE(v.as_int() == 7);
        REQUIRE(Value(42L).as_int() == 42);
    }

    SECTION("bool stays bool") {
        Value v(true);
        REQUIRE(v.is_bool());
        REQUIRE(v.to_string() == "True");
        REQUIRE(v.as_int() == 1);
    }

    SECTION("floats render with a decimal point") {
        REQUIRE(Value(2.5).to_string() == "2.5");
        REQUIRE(Value(3.0).to_string() == "3.0");
        REQUIRE(Value(std::nan("")).to_string() == "nan");
    }

    SECTION("strings render raw, repr quotes them") {
        Value v("abc");
        REQUIRE(v.is_string());
        REQUIRE(v.to_string() == "abc");
        REQUIRE(v.repr() == "'abc'");
    }

    SECTION("a null object pointer is None") {
        REQUIRE(Value(ObjectPtr{}).is_none());
    }

    SECTION("accessors throw TypeError on mismatch") {
        REQUIRE_THROWS_AS(Value("x").as_int(), TypeError);
        REQUIRE_THROWS_AS(Value(1).as_string(), TypeError);
        REQUIRE_THROWS_AS(Value(1).as_object(), TypeError);
    }
}

TEST_CASE("Value equality and ordering", "[core][value]") {
    REQUIRE(Value(1) == Value(1.0));
    REQUIRE_FALSE(Value(1) == Value("1"));
    REQUIRE(Value() == Value());
    REQUIRE_FALSE(Value() == Value(0));

    REQUIRE(compare_values(Value(), Value(-100)) < 0);
    REQUIRE(compare_values(Value(3), Value(2.5)) > 0);
    REQUIRE(compare_values(Value(1000), Value("a")) < 0);
    REQUIRE(compare_values(Value("a"), Value("b")) < 0);
    REQUIRE(compare_values(Value(2), Value(2.0)) == 0);

    SECTION("equal values hash equally") {
        ValueHash hash;
        REQUIRE(hash(Value(2)) == hash(Value(2.0)));
        RowHash row_hash;
        REQUIRE(row_hash(Row{1, "a"}) == row_hash(Row{1.0, "a"}));
    }
}

TEST_CASE("Blob cells compare by content", "[core][value]") {
    auto a = Blob::make("\x89PNG", "PNG");
    auto b = Blob::make("\x89PNG", "PNG");
    auto c = Blob::make("other", "PNG");

    REQUIRE(Value(a) == Value(b));
    REQUIRE_FALSE(Value(a) == Value(c));
    REQUIRE(a->unique_id() == b->unique_id());
    REQUIRE(a->unique_id() != c->unique_id());
    REQUIRE(a->unique_id().size() == 64);
    REQUIRE(a->to_string() == "<Blob PNG 4 bytes>");

    SECTION("encode and decode restore the blob") {
        auto restored = Blob::decode(a->encode());
        REQUIRE(restored->equals(*a));
    }

    SECTION("truncated payloads are rejected") {
        REQUIRE_THROWS_AS(Blob::decode("ab"), LoadError);
    }
}

TEST_CASE("Types are derived from values", "[core][value]") {
    REQUIRE(type_of(Value(1)) == Type::integer());
    REQUIRE(type_of(Value(1.5)) == Type::floating());
    REQUIRE(type_of(Value("s")) == Type::string());
    REQUIRE(type_of(Value()) == Type::any());
    REQUIRE(type_of(Value(Blob::make("x"))) == Type::blob());

    SECTION("common type ignores None and widens int to float") {
        REQUIRE(common_type_for({1, Value(), 2}) == Type::integer());
        REQUIRE(common_type_for({1, 2.5}) == Type::floating());
        REQUIRE(common_type_for({1, "a"}) == Type::any());
        REQUIRE(common_type_for({Value(), Value()}) == Type::any());
    }

    SECTION("type names round trip") {
        for (const auto& type : {Type::integer(), Type::floating(), Type::string(), Type::boolean(),
                                 Type::table(), Type::blob(), Type::any(),
                                 Type::object("PeakMap")}) {
            REQUIRE(parse_type(to_string(type)) == type);
        }
        REQUIRE_THROWS_AS(Type::object(""), TypeError);
    }
}

TEST_CASE("Values are coerced to column types", "[core][value]") {
    REQUIRE(coerce(Value("12"), Type::integer()) == Value(12));
    REQUIRE(coerce(Value(2.9), Type::integer()).as_int() == 2);
    REQUIRE(coerce(Value(3), Type::floating()).is_float());
    REQUIRE(coerce(Value(3), Type::string()) == Value("3"));
    REQUIRE(coerce(Value(), Type::integer()).is_none());
    REQUIRE_THROWS_AS(coerce(Value("abc"), Type::integer()), TypeError);
    REQUIRE_THROWS_AS(coerce(Value("1.x"), Type::floating()), TypeError);

    auto converted = convert_to_common_type({1, 2.5, Value()});
    REQUIRE(converted[0].is_float());
    REQUIRE(converted[2].is_none());
}

TEST_CASE("Postfixes are parsed from column names", "[core][postfix]") {
    auto tagged = parse_postfix("mz__3");
    REQUIRE(tagged.has_value());
    REQUIRE(tagged->prefix == "mz");
    REQUIRE(tagged->tag == "__3");
    REQUIRE(tagged->number == 3);

    auto plain = parse_postfix("mz");
    REQUIRE(plain->number == -1);
    REQUIRE(plain->tag.empty());

    REQUIRE_FALSE(parse_postfix("__hidden").has_value());
    REQUIRE_FALSE(parse_postfix("mz__left")->number.has_value());
    REQUIRE_THROWS_AS(parse_postfix("a__1__2"), SchemaError);

    REQUIRE(shift_postfix("mz__0", 2) == "mz__2");
    REQUIRE(shift_postfix("mz", 1) == "mz__0");
    REQUIRE(shift_postfix("mz__x", 1) == "mz__x");

    REQUIRE(postfix_range({"a", "b__2", "c__5"}) == std::pair{-1, 5});
    REQUIRE(postfix_range({"a__1", "b__2"}) == std::pair{1, 2});
    REQUIRE(postfix_range({}) == std::pair{-1, -1});
}
