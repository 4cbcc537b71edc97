#include <tabula/io/print.hpp>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <sstream>

namespace tabula::io {

namespace {

void print_line(std::ostream& out, const std::vector<std::string>& cells,
                const std::vector<std::size_t>& widths) {
    std::string line;
    for (std::size_t i = 0; i < cells.size(); ++i) {
        if (i > 0) {
            line += ' ';
        }
        line += fmt::format("{:<{}}", cells[i], widths[i]);
    }
    fmt::print(out, "{}\n", line);
}

}  // namespace

void print(const Table& table, std::ostream& out, const PrintOptions& options) {
    std::vector<std::size_t> indices;
    for (std::size_t i = 0; i < table.num_columns(); ++i) {
        if (table.columns().format(i).has_value()) {
            indices.push_back(i);
        }
    }

    auto render = [&](const Row& row) {
        std::vector<std::string> cells;
        cells.reserve(indices.size());
        for (auto i : indices) {
            cells.push_back(table.formatter(i)(row[i]));
        }
        return cells;
    };

    std::vector<std::size_t> widths;
    std::vector<std::string> names;
    std::vector<std::string> types;
    for (auto i : indices) {
        const auto& name = table.columns().name(i);
        std::size_t width = std::max(options.width, name.size());
        for (const auto& row : table.rows()) {
            width = std::max(width, table.formatter(i)(row[i]).size());
        }
        widths.push_back(width);
        names.push_back(name);
        types.push_back(to_string(table.columns().type(i)));
    }

    if (options.title.has_value()) {
        std::string frame(options.title->size(), '=');
        fmt::print(out, "{}\n{}\n{}\n", frame, *options.title, frame);
    }
    print_line(out, names, widths);
    print_line(out, types, widths);
    print_line(out, std::vector<std::string>(indices.size(), "------"), widths);

    const auto& rows = table.rows();
    if (options.max_lines.has_value() && rows.size() > *options.max_lines) {
        auto half = *options.max_lines / 2;
        for (std::size_t r = 0; r < half; ++r) {
            print_line(out, render(rows[r]), widths);
        }
        fmt::print(out, "...\n");
        for (std::size_t r = rows.size() - half; r < rows.size(); ++r) {
            print_line(out, render(rows[r]), widths);
        }
        return;
    }
    for (const auto& row : rows) {
        print_line(out, render(row), widths);
    }
}

auto to_text(const Table& table, const PrintOptions& options) -> std::string {
    std::ostringstream out;
    print(table, out, options);
    return out.str();
}

}  // namespace tabula::io
