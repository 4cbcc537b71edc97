#pragma once

#include <tabula/table/table.hpp>

#include <vector>

namespace tabula {

/// Concatenates tables with differing columns.
///
/// The result schema is taken from `reference` when given, else the union of
/// all column names in first-seen order. Columns a table lacks are filled
/// with None. Conflicting types, formats or column orders raise SchemaError
/// unless `force_merge` is set, in which case the first definition wins.
/// Title and meta are taken from the first table.
[[nodiscard]] auto merge_tables(const std::vector<Table>& tables, const Table* reference = nullptr,
                                bool force_merge = false) -> Table;

}  // namespace tabula
