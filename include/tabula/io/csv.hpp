#pragma once

#include <tabula/core/format.hpp>
#include <tabula/table/table.hpp>

#include <filesystem>
#include <map>
#include <string>

namespace tabula::io {

struct CsvOptions {
    char separator = ';';
    /// Keep cells reading "None" as strings instead of missing values.
    bool keep_none = false;
    /// Formats by column name, overriding the guessed ones.
    std::map<std::string, Format> formats;
};

/// Writes `table` as "; " separated text. `path` must end in ".csv"; if it
/// exists, "path.1", "path.2", ... are tried. Returns the path written.
auto store_csv(const Table& table, const std::filesystem::path& path, bool only_visible = true)
    -> std::filesystem::path;

/// Reads a table with a header line. Cells are converted to int, then float,
/// then float with "," as decimal point, else kept as string.
[[nodiscard]] auto load_csv(const std::filesystem::path& path, const CsvOptions& options = {})
    -> Table;

/// Int, float, decimal-comma float or string, in that order.
[[nodiscard]] auto best_convert(std::string_view text) -> Value;

}  // namespace tabula::io
