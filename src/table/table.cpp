#include <tabula/core/error.hpp>
#include <tabula/core/postfix.hpp>
#include <tabula/table/table.hpp>

#include <fmt/format.h>
#include <robin_hood.h>

namespace tabula {

namespace {

auto normalize_formats(std::vector<Format> formats) -> std::vector<Format> {
    for (auto& format : formats) {
        if (format.has_value() && format->empty()) {
            format.reset();
        }
    }
    return formats;
}

auto check_row_index(std::size_t row_index, std::size_t rows) -> void {
    if (row_index >= rows) {
        throw ShapeMismatch(fmt::format("row index {} out of range for table with {} rows",
                                        row_index, rows));
    }
}

}  // namespace

Table::Table(std::vector<std::string> names, std::vector<Type> types, std::vector<Format> formats,
             std::vector<Row> rows, std::optional<std::string> title, Meta meta)
    : Table(create(std::move(names), std::move(types), std::move(formats), std::move(rows),
                   std::move(title), std::move(meta))) {
    for (const auto& name : column_names()) {
        if (name.find(kPostfixSeparator) != std::string::npos) {
            throw SchemaError(
                fmt::format("illegal column name {}, double underscores not allowed", name));
        }
    }
}

auto Table::create(std::vector<std::string> names, std::vector<Type> types,
                   std::vector<Format> formats, std::vector<Row> rows,
                   std::optional<std::string> title, Meta meta) -> Table {
    ColumnRegistry columns(std::move(names), std::move(types),
                           normalize_formats(std::move(formats)));
    return Table(Unchecked{}, std::move(columns), std::move(rows), std::move(title),
                 std::move(meta));
}

Table::Table(Unchecked, ColumnRegistry columns, std::vector<Row> rows,
             std::optional<std::string> title, Meta meta)
    : columns_(std::move(columns)),
      rows_(std::move(rows)),
      title_(std::move(title)),
      meta_(std::move(meta)),
      ref_(TableRef::next()) {
    for (std::size_t i = 0; i < rows_.size(); ++i) {
        if (rows_[i].size() != columns_.size()) {
            throw ShapeMismatch(fmt::format("row {} has length {}, expected {}", i,
                                            rows_[i].size(), columns_.size()));
        }
    }
    reset_internals();
}

Table::Table(const Table& other)
    : Object(other),
      columns_(other.columns_),
      rows_(other.rows_),
      title_(other.title_),
      meta_(other.meta_),
      primary_index_(other.primary_index_),
      version_(other.version_),
      formatters_(other.formatters_),
      ref_(TableRef::next()) {}

auto Table::operator=(const Table& other) -> Table& {
    if (this != &other) {
        columns_ = other.columns_;
        rows_ = other.rows_;
        title_ = other.title_;
        meta_ = other.meta_;
        primary_index_ = other.primary_index_;
        version_ = other.version_;
        formatters_ = other.formatters_;
    }
    return *this;
}

auto Table::clone() const -> ObjectPtr { return std::make_shared<const Table>(*this); }

auto Table::to_string() const -> std::string {
    auto n = rows_.size();
    return fmt::format("<Table '{}' with {} row{}>", title_.value_or(""), n, n == 1 ? "" : "s");
}

auto Table::visible_column_names() const -> std::vector<std::string> {
    std::vector<std::string> out;
    for (std::size_t i = 0; i < columns_.size(); ++i) {
        if (columns_.format(i).has_value()) {
            out.push_back(columns_.name(i));
        }
    }
    return out;
}

auto Table::col_type(std::string_view name) const -> const Type& {
    return columns_.type(columns_.index_of(name));
}

auto Table::col_format(std::string_view name) const -> const Format& {
    return columns_.format(columns_.index_of(name));
}

auto Table::row(std::size_t index) const -> const Row& {
    check_row_index(index, rows_.size());
    return rows_[index];
}

void Table::set_meta(MetaKey key, MetaValue value) {
    bool is_cache = std::holds_alternative<std::string>(key) &&
                    std::get<std::string>(key) == "unique_id";
    meta_.set(std::move(key), std::move(value));
    if (!is_cache) {
        meta_.erase(MetaKey{std::string("unique_id")});
    }
}

auto Table::column(const std::string& name) const -> expr::ColumnHandle {
    return expr::ColumnHandle(*this, name, col_type(name));
}

auto Table::column_values(std::string_view name) const -> std::vector<Value> {
    auto index = columns_.index_of(name);
    std::vector<Value> values;
    values.reserve(rows_.size());
    for (const auto& row : rows_) {
        values.push_back(row[index]);
    }
    return values;
}

auto Table::get_value(std::size_t row_index, std::string_view name, const Value& fallback) const
    -> Value {
    check_row_index(row_index, rows_.size());
    auto index = columns_.find(name);
    if (!index) {
        return fallback;
    }
    return rows_[row_index][*index];
}

auto Table::get_values(std::size_t row_index) const -> std::map<std::string, Value> {
    check_row_index(row_index, rows_.size());
    std::map<std::string, Value> out;
    for (std::size_t i = 0; i < columns_.size(); ++i) {
        out.emplace(columns_.name(i), rows_[row_index][i]);
    }
    return out;
}

void Table::set_value(std::size_t row_index, std::string_view name, const Value& value) {
    check_row_index(row_index, rows_.size());
    auto index = columns_.index_of(name);
    rows_[row_index][index] = coerce(value, columns_.type(index));
    if (primary_index_ == name) {
        primary_index_.reset();
    }
    reset_internals();
}

void Table::validate_row(Row& row) const {
    if (row.size() != columns_.size()) {
        throw ShapeMismatch(
            fmt::format("row has wrong length {}, expected {}", row.size(), columns_.size()));
    }
    for (std::size_t i = 0; i < row.size(); ++i) {
        row[i] = coerce(row[i], columns_.type(i));
    }
}

void Table::set_row(std::size_t row_index, Row row) {
    check_row_index(row_index, rows_.size());
    validate_row(row);
    rows_[row_index] = std::move(row);
    primary_index_.reset();
    reset_internals();
}

void Table::add_row(Row row) {
    validate_row(row);
    rows_.push_back(std::move(row));
    primary_index_.reset();
    reset_internals();
}

void Table::set_col_type(std::string_view name, Type type) {
    columns_.set_type(name, std::move(type));
    reset_internals();
}

void Table::set_col_format(std::string_view name, Format format) {
    columns_.set_format(name, std::move(format));
    reset_internals();
}

auto Table::info() const -> std::string {
    std::string out = fmt::format("table info:   title={}\n\n", title_.value_or("None"));
    out += fmt::format("   meta=\n{}", meta_.to_string());
    out += fmt::format("   rows={}\n\n", rows_.size());
    for (std::size_t i = 0; i < columns_.size(); ++i) {
        robin_hood::unordered_flat_set<Value, ValueHash> distinct;
        std::size_t nones = 0;
        for (const auto& row : rows_) {
            distinct.insert(row[i]);
            if (row[i].is_none()) {
                ++nones;
            }
        }
        auto txt = fmt::format("{:3d} diff vals, {:3d} Nones", distinct.size(), nones);
        const auto& format = columns_.format(i);
        out += fmt::format("   column {:2d}:  {:<25} in column {:<15} of type {:<10} with format {}\n",
                           i, txt, columns_.name(i), tabula::to_string(columns_.type(i)),
                           format.has_value() ? fmt::format("'{}'", *format) : "None");
    }
    return out;
}

void Table::reset_internals() {
    formatters_.clear();
    formatters_.reserve(columns_.size());
    for (const auto& format : columns_.formats()) {
        formatters_.push_back(make_formatter(format));
    }
    meta_.erase(MetaKey{std::string("unique_id")});
}

auto to_table(const std::string& name, std::vector<Value> values, ColumnSpec spec,
              std::optional<std::string> title, Meta meta) -> Table {
    if (spec.insert_before.has_value() || spec.insert_after.has_value()) {
        throw ArgumentError("to_table does not support insert positions");
    }
    values = convert_to_common_type(std::move(values));
    Type type = spec.type.value_or(common_type_for(values));
    Format format = spec.format;
    if (format.has_value() && format->empty()) {
        format = guess_format(name, type);
    }
    std::vector<Row> rows;
    rows.reserve(values.size());
    for (auto& value : values) {
        rows.push_back(Row{coerce(value, type)});
    }
    return Table({name}, {std::move(type)}, {std::move(format)}, std::move(rows), std::move(title),
                 std::move(meta));
}

}  // namespace tabula
