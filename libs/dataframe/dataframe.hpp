#pragma once
// Tabula dataframe bridge: converts tables to and from Apache Arrow tables.
//
// Column type mappings:
//   int   <-> int64 (other integer widths are read as int)
//   float <-> float64 (float32 is read as float), NaN becomes None
//   bool  <-> boolean
//   str   <-> utf8 / large_utf8
//   Blob  <-> binary
//   Any   <-> null (only for columns without values)

#include <tabula/core/format.hpp>
#include <tabula/core/meta.hpp>
#include <tabula/table/table.hpp>

#include <arrow/api.h>

#include <map>
#include <memory>
#include <optional>
#include <string>

namespace tabula::dataframe {

struct FromArrowOptions {
    std::optional<std::string> title;
    Meta meta;
    /// Column types by name, replacing the ones derived from the Arrow schema.
    std::map<std::string, Type> types;
    /// Column formats by name; checked before type_formats.
    std::map<std::string, Format> formats;
    /// Column formats by type.
    std::map<TypeKind, Format> type_formats;
};

/// Arrow table with one field per column; throws TypeError for columns
/// holding nested tables or other objects.
[[nodiscard]] auto to_arrow(const Table& table) -> std::shared_ptr<arrow::Table>;

/// Table from an Arrow table; throws TypeError for unsupported Arrow types.
[[nodiscard]] auto from_arrow(const arrow::Table& table, const FromArrowOptions& options = {})
    -> Table;

}  // namespace tabula::dataframe
