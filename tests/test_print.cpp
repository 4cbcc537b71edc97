#include <tabula/io/print.hpp>
#include <tabula/table/table.hpp>

#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <string>
#include <vector>

using namespace tabula;

namespace {

auto lines_of(const std::string& text) -> std::vector<std::string> {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

auto sample() -> Table {
    return Table({"id", "name", "secret"}, {Type::integer(), Type::string(), Type::string()},
                 {"%d", "%s", std::nullopt}, {{1, "x", "s1"}, {22, Value(), "s2"}});
}

}  // namespace

TEST_CASE("print shows visible columns", "[io][print]") {
    auto lines = lines_of(io::to_text(sample()));
    REQUIRE(lines.size() == 5);
    REQUIRE(lines[0] == "id       name    ");
    REQUIRE(lines[1] == "int      str     ");
    REQUIRE(lines[2] == "------   ------  ");
    REQUIRE(lines[3] == "1        x       ");
    REQUIRE(lines[4] == "22       -       ");
}

TEST_CASE("print widens columns for long content", "[io][print]") {
    auto t = to_table("label", {"a rather long text"});
    auto lines = lines_of(io::to_text(t, io::PrintOptions{.width = 4}));
    REQUIRE(lines[0].size() == std::string("a rather long text").size());
    REQUIRE(lines[3] == "a rather long text");
}

TEST_CASE("print with title and line limit", "[io][print]") {
    auto t = to_table("n", {1, 2, 3, 4, 5});
    auto lines = lines_of(
        io::to_text(t, io::PrintOptions{.width = 1, .title = "numbers", .max_lines = 2}));
    REQUIRE(lines == std::vector<std::string>{"=======", "numbers", "=======", "n", "int",
                                              "------", "1", "...", "5"});

    SECTION("short tables are printed completely") {
        auto all = lines_of(io::to_text(t, io::PrintOptions{.width = 1, .max_lines = 10}));
        REQUIRE(all.size() == 8);
    }
}
