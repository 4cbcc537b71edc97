#include <tabula/core/error.hpp>
#include <tabula/table/table.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <robin_hood.h>

#include <algorithm>
#include <numeric>

namespace tabula {

auto Table::filter(const expr::Expression& condition) const -> Table {
    std::vector<std::string> needed;
    for (const auto& ref : expr::referenced_columns(*condition.node())) {
        if (ref.table != ref_) {
            throw ArgumentError(fmt::format(
                "filter condition {} refers to column {} of another table",
                condition.to_string(), ref.name));
        }
        needed.push_back(ref.name);
    }
    expr::Context context;
    context.emplace(ref_, context_for(needed));
    auto flags = expr::evaluate(*condition.node(), context);
    if (!flags) {
        throw ArgumentError(fmt::format("filter failed: {}", flags.error()));
    }

    Table out(Unchecked{}, columns_, {}, title_, meta_);
    out.primary_index_ = primary_index_;
    if (flags->values.size() == 1) {
        if (flags->values.front().truthy()) {
            out.rows_ = rows_;
        }
        return out;
    }
    if (flags->values.size() != rows_.size()) {
        throw ShapeMismatch(fmt::format("filter condition yields {} values for a table with {} rows",
                                        flags->values.size(), rows_.size()));
    }
    for (std::size_t i = 0; i < rows_.size(); ++i) {
        if (flags->values[i].truthy()) {
            out.rows_.push_back(rows_[i]);
        }
    }
    return out;
}

auto Table::filter(bool keep) const -> Table { return filter(expr::Expression(keep)); }

auto Table::sort_by(const std::vector<std::string>& names, bool ascending)
    -> std::vector<std::size_t> {
    if (names.empty()) {
        throw ArgumentError("sort_by requires at least one column name");
    }
    std::vector<std::size_t> keys;
    keys.reserve(names.size());
    for (const auto& name : names) {
        keys.push_back(columns_.index_of(name));
    }
    std::vector<std::size_t> permutation(rows_.size());
    std::iota(permutation.begin(), permutation.end(), 0);
    std::stable_sort(permutation.begin(), permutation.end(), [&](std::size_t a, std::size_t b) {
        for (auto key : keys) {
            int c = compare_values(rows_[a][key], rows_[b][key]);
            if (c != 0) {
                return ascending ? c < 0 : c > 0;
            }
        }
        return false;
    });

    std::vector<Row> sorted;
    sorted.reserve(rows_.size());
    for (auto index : permutation) {
        sorted.push_back(std::move(rows_[index]));
    }
    rows_ = std::move(sorted);
    if (ascending) {
        primary_index_ = names.front();
    } else {
        primary_index_.reset();
    }
    reset_internals();
    return permutation;
}

auto Table::split_by(const std::vector<std::string>& names) const -> std::vector<Table> {
    ensure_columns(names);
    std::vector<std::size_t> keys;
    keys.reserve(names.size());
    for (const auto& name : names) {
        keys.push_back(columns_.index_of(name));
    }

    robin_hood::unordered_flat_map<Row, std::size_t, RowHash, RowEq> group_of;
    std::vector<std::vector<Row>> groups;
    for (const auto& row : rows_) {
        Row key;
        key.reserve(keys.size());
        for (auto index : keys) {
            key.push_back(row[index]);
        }
        auto [it, inserted] = group_of.try_emplace(std::move(key), groups.size());
        if (inserted) {
            groups.emplace_back();
        }
        groups[it->second].push_back(row);
    }

    std::vector<Table> out;
    out.reserve(groups.size());
    for (auto& rows : groups) {
        Table part(Unchecked{}, columns_, std::move(rows), title_, meta_);
        part.primary_index_ = primary_index_;
        out.push_back(std::move(part));
    }
    return out;
}

auto Table::unique_rows() const -> Table {
    Table out(Unchecked{}, columns_, {}, title_, meta_);
    out.primary_index_ = primary_index_;
    robin_hood::unordered_flat_set<Row, RowHash, RowEq> seen;
    seen.reserve(rows_.size());
    for (const auto& row : rows_) {
        if (seen.insert(row).second) {
            out.rows_.push_back(row);
        }
    }
    return out;
}

auto Table::collapse(const std::vector<std::string>& names) const -> Table {
    ensure_columns(names);
    std::vector<std::string> master_names = names;
    std::vector<Type> master_types;
    std::vector<Format> master_formats;
    for (const auto& name : names) {
        master_types.push_back(col_type(name));
        master_formats.push_back(col_format(name));
    }
    master_names.emplace_back("collapsed");
    master_types.push_back(Type::table());
    master_formats.emplace_back("%s");

    std::vector<Row> rows;
    for (auto& part : split_by(names)) {
        Row row;
        std::vector<std::string> labels;
        for (const auto& name : names) {
            auto value = part.get_value(0, name);
            labels.push_back(fmt::format("{}={}", name, value.to_string()));
            row.push_back(std::move(value));
        }
        part.set_title(fmt::format("{}", fmt::join(labels, ", ")));
        row.emplace_back(std::make_shared<const Table>(std::move(part)));
        rows.push_back(std::move(row));
    }
    return Table(Unchecked{},
                 ColumnRegistry(std::move(master_names), std::move(master_types),
                                std::move(master_formats)),
                 std::move(rows), std::nullopt, meta_);
}

void Table::append(const Table& other) { append(std::vector<Table>{other}); }

void Table::append(const std::vector<Table>& others) {
    for (const auto& other : others) {
        if (other.column_names() != column_names()) {
            throw SchemaError(fmt::format("the column names do not match: [{}] vs [{}]",
                                          fmt::join(column_names(), ", "),
                                          fmt::join(other.column_names(), ", ")));
        }
        if (other.column_types() != column_types()) {
            throw SchemaError("the column types do not match");
        }
    }
    for (const auto& other : others) {
        rows_.insert(rows_.end(), other.rows_.begin(), other.rows_.end());
    }
    primary_index_.reset();
    reset_internals();
}

auto Table::slice(std::size_t begin, std::size_t end) const -> Table {
    end = std::min(end, rows_.size());
    begin = std::min(begin, end);
    std::vector<Row> rows(rows_.begin() + static_cast<std::ptrdiff_t>(begin),
                          rows_.begin() + static_cast<std::ptrdiff_t>(end));
    Table out(Unchecked{}, columns_, std::move(rows), title_, meta_);
    out.primary_index_ = primary_index_;
    return out;
}

auto Table::row_table(std::size_t index) const -> Table {
    if (index >= rows_.size()) {
        throw ShapeMismatch(
            fmt::format("row index {} out of range for table with {} rows", index, rows_.size()));
    }
    return slice(index, index + 1);
}

}  // namespace tabula
