#include <tabula/tabula.hpp>

#include <CLI/CLI.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

namespace {

void configure_logging(bool verbose) {
    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
        return;
    }
    spdlog::set_level(spdlog::level::info);
    // TABULA_LOG_LEVEL takes names like "debug", "warn" or "off".
    if (const char* env = std::getenv("TABULA_LOG_LEVEL"); env != nullptr) {
        spdlog::set_level(spdlog::level::from_str(env));
    }
}

auto read_table(const std::string& path, char sep) -> tabula::Table {
    if (path.ends_with(".csv") || path.ends_with(".CSV")) {
        return tabula::io::load_csv(path, tabula::io::CsvOptions{.separator = sep});
    }
    return tabula::Table::load(path);
}

}  // namespace

auto main(int argc, char** argv) -> int {
    CLI::App app{"tabula: inspect and convert stored tables"};
    app.set_version_flag("--version", "tabula_tool 0.1.0");
    app.require_subcommand(1);

    bool verbose = false;
    app.add_flag("-v,--verbose", verbose, "Enable debug logging");

    std::string input;
    std::string output;
    char sep = ';';
    std::optional<std::size_t> max_lines;
    bool force = false;

    auto* info = app.add_subcommand("info", "Summarize the columns of a table");
    info->add_option("input", input, "Stored .table or .csv file")->required();
    info->add_option("--sep", sep, "CSV field separator (default: ';')");

    auto* print = app.add_subcommand("print", "Print a table");
    print->add_option("input", input, "Stored .table or .csv file")->required();
    print->add_option("--sep", sep, "CSV field separator (default: ';')");
    print->add_option("--max-lines", max_lines, "Shorten long tables to head and tail");

    auto* to_csv = app.add_subcommand("to-csv", "Export a stored table as CSV");
    to_csv->add_option("input", input, "Stored .table file")->required();
    to_csv->add_option("output", output, "Target .csv file")->required();

    auto* from_csv = app.add_subcommand("from-csv", "Convert a CSV file to a stored table");
    from_csv->add_option("input", input, "Source .csv file")->required();
    from_csv->add_option("output", output, "Target .table file")->required();
    from_csv->add_option("--sep", sep, "CSV field separator (default: ';')");
    from_csv->add_flag("--force", force, "Overwrite an existing target file");

    CLI11_PARSE(app, argc, argv);
    configure_logging(verbose);

    try {
        if (info->parsed()) {
            std::cout << read_table(input, sep).info();
        } else if (print->parsed()) {
            auto table = read_table(input, sep);
            tabula::io::print(table, std::cout,
                              tabula::io::PrintOptions{.title = table.title(), .max_lines = max_lines});
        } else if (to_csv->parsed()) {
            auto written = tabula::io::store_csv(tabula::Table::load(input), output);
            fmt::print("{}\n", written.string());
        } else if (from_csv->parsed()) {
            auto table = tabula::io::load_csv(input, tabula::io::CsvOptions{.separator = sep});
            table.store(output, tabula::StoreOptions{.force_overwrite = force});
        }
    } catch (const tabula::Error& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
    return 0;
}
