#include <tabula/core/format.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace tabula;

TEST_CASE("printf style formats", "[core][format]") {
    REQUIRE(format_value(Value(3), "%d") == "3");
    REQUIRE(format_value(Value(3.14159), "%.2f") == "3.14");
    REQUIRE(format_value(Value(2.7), "%d") == "2");
    REQUIRE(format_value(Value("abc"), "%s") == "abc");
    REQUIRE(format_value(Value("abc"), "%r") == "'abc'");
    REQUIRE(format_value(Value(5), "%5d") == "    5");
}

TEST_CASE("None renders as a dash", "[core][format]") {
    REQUIRE(format_value(Value(), "%d") == "-");
    REQUIRE(format_value(Value(), "{}") == "-");
}

TEST_CASE("failing formats render as empty string", "[core][format]") {
    REQUIRE(format_value(Value("abc"), "%d").empty());
    REQUIRE(format_value(Value("abc"), "%.2f").empty());
}

TEST_CASE("minutes format", "[core][format]") {
    REQUIRE(format_value(Value(150.0), std::string(kMinutesFormat)) == "2.50m");
    REQUIRE(format_value(Value(60), std::string(kMinutesFormat)) == "1.00m");
}

TEST_CASE("fmt replacement field formats", "[core][format]") {
    REQUIRE(format_value(Value(7), "{:>3}") == "  7");
    REQUIRE(format_value(Value(1.5), "{:.3f}") == "1.500");
    REQUIRE(format_value(Value("x"), "<{}>") == "<x>");
}

TEST_CASE("formats are guessed from name and type", "[core][format]") {
    REQUIRE(guess_format("mz", Type::floating()) == "%.5f");
    REQUIRE(guess_format("mzmin", Type::integer()) == "%.5f");
    REQUIRE(guess_format("rt", Type::floating()) == std::string(kMinutesFormat));
    REQUIRE(guess_format("intensity", Type::floating()) == "%.2f");
    REQUIRE(guess_format("count", Type::integer()) == "%d");
    REQUIRE(guess_format("name", Type::string()) == "%s");
    REQUIRE(guess_format("mz", Type::string()) == "%s");
    REQUIRE(guess_format("peaks", Type::table()) == "%r");
}

TEST_CASE("formatters hide columns without format", "[core][format]") {
    auto hidden = make_formatter(std::nullopt);
    REQUIRE(hidden(Value(3)).empty());
    auto shown = make_formatter(std::string("%d"));
    REQUIRE(shown(Value(3)) == "3");
    REQUIRE(shown(Value()) == "-");
}
