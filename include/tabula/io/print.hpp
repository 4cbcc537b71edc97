#pragma once

#include <tabula/table/table.hpp>

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>

namespace tabula::io {

struct PrintOptions {
    /// Minimal column width.
    std::size_t width = 8;
    /// Printed framed above the table.
    std::optional<std::string> title;
    /// Longer tables are shortened to head, "..." and tail.
    std::optional<std::size_t> max_lines;
};

/// Prints the visible columns of `table`: names, types, a separator line and
/// the formatted rows.
void print(const Table& table, std::ostream& out, const PrintOptions& options = {});

[[nodiscard]] auto to_text(const Table& table, const PrintOptions& options = {}) -> std::string;

}  // namespace tabula::io
