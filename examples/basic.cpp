#include <tabula/tabula.hpp>

#include <fmt/core.h>

#include <iostream>

auto main() -> int {
    using tabula::Table;
    using tabula::Type;

    Table peaks({"id", "mz", "rt"}, {Type::integer(), Type::floating(), Type::floating()},
                {"%d", "%.5f", "@minutes"},
                {{0, 100.0, 60.0}, {1, 200.5, 90.0}, {2, 300.25, 120.0}}, "peaks");

    fmt::print("=== filter ===\n");
    auto mz = peaks.column("mz");
    auto heavy = peaks.filter(mz > 150.0);
    tabula::io::print(heavy, std::cout);

    fmt::print("\n=== column algebra ===\n");
    peaks.add_column("mz_shifted", peaks.column("mz") + 1.0, tabula::ColumnSpec{.format = "%.2f"});
    tabula::io::print(peaks, std::cout);

    fmt::print("\n=== join ===\n");
    Table targets({"name", "mz"}, {Type::string(), Type::floating()}, {"%s", "%.5f"},
                  {{"a", 100.0}, {"b", 300.0}}, "targets");
    auto tmz = targets.column("mz");
    auto matched = peaks.join(targets, ((peaks.column("mz") - tmz) < 0.5) &
                                           ((tmz - peaks.column("mz")) < 0.5));
    tabula::io::print(matched, std::cout, tabula::io::PrintOptions{.title = matched.title()});

    fmt::print("\nunique id: {}\n", matched.unique_id());
    return 0;
}
