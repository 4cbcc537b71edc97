#include <tabula/core/error.hpp>
#include <tabula/core/postfix.hpp>
#include <tabula/table/columns.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <array>
#include <set>

namespace tabula {

namespace {

// Public Table members, so that columns never shadow them.
constexpr auto kReservedNames = std::to_array<std::string_view>({
    "add_column", "add_constant_column", "add_enumeration", "add_row", "append", "clone",
    "col_format", "col_index", "col_type", "collapse", "column", "column_formats", "column_names",
    "column_types", "column_values", "columns", "compress_objects", "copy", "create", "decode",
    "drop_columns", "empty", "encode", "ensure_columns", "equals", "extract_columns", "filter",
    "find_postfixes", "formatter", "get_value", "get_values", "has_column", "hash", "info",
    "join", "left_join", "load", "max_postfix", "meta", "min_postfix", "num_columns",
    "primary_index", "ref", "remove_postfixes", "rename_columns", "rename_postfixes",
    "replace_column", "reset_internals", "row", "row_table", "rows", "set_col_format",
    "set_col_type", "set_meta", "set_row", "set_title", "set_value", "size", "slice", "sort_by",
    "split_by", "store", "supported_postfixes", "title", "to_string", "type_name", "unique_id",
    "unique_rows", "update_column", "version", "visible_column_names",
});

auto sorted_join(const std::set<std::string>& names) -> std::string {
    return fmt::format("{}", fmt::join(names, ", "));
}

}  // namespace

auto is_reserved_name(std::string_view name) -> bool {
    return std::find(kReservedNames.begin(), kReservedNames.end(), name) != kReservedNames.end();
}

ColumnRegistry::ColumnRegistry(std::vector<std::string> names, std::vector<Type> types,
                               std::vector<Format> formats)
    : names_(std::move(names)), types_(std::move(types)), formats_(std::move(formats)) {
    if (names_.size() != types_.size() || names_.size() != formats_.size()) {
        throw ShapeMismatch(fmt::format("got {} column names, {} types and {} formats",
                                        names_.size(), types_.size(), formats_.size()));
    }
    std::map<std::string, std::size_t> counts;
    for (const auto& name : names_) {
        ++counts[name];
    }
    std::vector<std::string> multiples;
    for (const auto& [name, count] : counts) {
        if (count > 1) {
            multiples.push_back(name);
        }
    }
    if (!multiples.empty()) {
        throw SchemaError(fmt::format("multiple columns: {}", fmt::join(multiples, ", ")));
    }
    for (const auto& name : names_) {
        if (is_reserved_name(name)) {
            throw SchemaError(fmt::format("column name '{}' not allowed", name));
        }
    }
    rebuild_index();
}

auto ColumnRegistry::find(std::string_view name) const -> std::optional<std::size_t> {
    if (auto it = index_.find(std::string(name)); it != index_.end()) {
        return it->second;
    }
    return std::nullopt;
}

auto ColumnRegistry::index_of(std::string_view name) const -> std::size_t {
    if (auto index = find(name)) {
        return *index;
    }
    throw SchemaError(fmt::format("column {} not found (available: {})", name,
                                  fmt::join(names_, ", ")));
}

auto ColumnRegistry::has_columns(const std::vector<std::string>& names) const -> bool {
    return std::all_of(names.begin(), names.end(),
                       [this](const std::string& name) { return has_column(name); });
}

void ColumnRegistry::ensure_columns(const std::vector<std::string>& names) const {
    std::set<std::string> missing;
    std::set<std::string> found;
    for (const auto& name : names) {
        if (has_column(name)) {
            found.insert(name);
        } else {
            missing.insert(name);
        }
    }
    if (missing.empty()) {
        return;
    }
    std::set<std::string> expected(names.begin(), names.end());
    if (expected != missing) {
        throw SchemaError(fmt::format("expected names {}, found {} but {} were missing",
                                      sorted_join(expected), sorted_join(found),
                                      sorted_join(missing)));
    }
    throw SchemaError(
        fmt::format("expected names {} but found {}", sorted_join(expected), sorted_join(found)));
}

void ColumnRegistry::set_type(std::string_view name, Type type) {
    types_[index_of(name)] = std::move(type);
}

void ColumnRegistry::set_format(std::string_view name, Format format) {
    formats_[index_of(name)] = std::move(format);
}

void ColumnRegistry::rename(const std::map<std::string, std::string>& mapping) {
    std::set<std::string> new_names;
    for (const auto& [old_name, new_name] : mapping) {
        if (!has_column(old_name)) {
            throw SchemaError(fmt::format("column {} does not exist", old_name));
        }
        if (!new_names.insert(new_name).second) {
            throw SchemaError("name overlap in new column names");
        }
        if (has_column(new_name)) {
            throw NameCollisionError(fmt::format("column {} already exists", new_name));
        }
        if (new_name.find(kPostfixSeparator) != std::string::npos) {
            throw SchemaError(fmt::format("double underscore in {} not allowed", new_name));
        }
        if (is_reserved_name(new_name)) {
            throw SchemaError(fmt::format("column name '{}' not allowed", new_name));
        }
    }
    rename_unchecked(mapping);
}

void ColumnRegistry::rename_unchecked(const std::map<std::string, std::string>& mapping) {
    std::vector<std::string> renamed = names_;
    for (auto& name : renamed) {
        if (auto it = mapping.find(name); it != mapping.end()) {
            name = it->second;
        }
    }
    std::set<std::string> unique(renamed.begin(), renamed.end());
    if (unique.size() != renamed.size()) {
        throw SchemaError(fmt::format("renaming results in ambiguous column names {}",
                                      fmt::join(renamed, ", ")));
    }
    names_ = std::move(renamed);
    rebuild_index();
}

void ColumnRegistry::insert(std::size_t position, std::string name, Type type, Format format) {
    if (has_column(name)) {
        throw NameCollisionError(fmt::format("column with name {} already exists", name));
    }
    if (is_reserved_name(name)) {
        throw SchemaError(fmt::format("column name '{}' not allowed", name));
    }
    if (position > names_.size()) {
        throw ArgumentError(fmt::format("column position {} out of range", position));
    }
    auto offset = static_cast<std::ptrdiff_t>(position);
    names_.insert(names_.begin() + offset, std::move(name));
    types_.insert(types_.begin() + offset, std::move(type));
    formats_.insert(formats_.begin() + offset, std::move(format));
    rebuild_index();
}

void ColumnRegistry::erase(std::vector<std::size_t> indices) {
    std::sort(indices.begin(), indices.end());
    indices.erase(std::unique(indices.begin(), indices.end()), indices.end());
    for (auto it = indices.rbegin(); it != indices.rend(); ++it) {
        auto offset = static_cast<std::ptrdiff_t>(*it);
        names_.erase(names_.begin() + offset);
        types_.erase(types_.begin() + offset);
        formats_.erase(formats_.begin() + offset);
    }
    rebuild_index();
}

void ColumnRegistry::rebuild_index() {
    index_.clear();
    index_.reserve(names_.size());
    for (std::size_t i = 0; i < names_.size(); ++i) {
        index_.emplace(names_[i], i);
    }
}

}  // namespace tabula
