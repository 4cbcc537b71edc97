#include <tabula/core/error.hpp>
#include <tabula/core/postfix.hpp>
#include <tabula/table/table.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <set>

namespace tabula {

auto Table::context_for(const std::vector<std::string>& names) const -> expr::TableCtx {
    expr::TableCtx ctx;
    for (const auto& name : names) {
        ctx.emplace(name, expr::ColumnCtx{.values = column_values(name),
                                          .sorted = primary_index_ == name,
                                          .type = col_type(name)});
    }
    return ctx;
}

auto Table::materialize(const std::string& name, const expr::Expression& expression) const
    -> Materialized {
    std::vector<std::string> needed;
    for (const auto& ref : expr::referenced_columns(*expression.node())) {
        if (ref.table != ref_) {
            throw ArgumentError(fmt::format(
                "column {} refers to a column {} of another table", name, ref.name));
        }
        needed.push_back(ref.name);
    }
    expr::Context context;
    context.emplace(ref_, context_for(needed));
    auto result = expr::evaluate(*expression.node(), context);
    if (!result) {
        throw ArgumentError(fmt::format("can not compute column {}: {}", name, result.error()));
    }
    auto values = std::move(result->values);
    if (values.size() == 1 && rows_.size() != 1) {
        values = std::vector<Value>(rows_.size(), values.front());
    } else if (values.size() != rows_.size()) {
        throw ShapeMismatch(fmt::format("expression for column {} has {} values, table has {} rows",
                                        name, values.size(), rows_.size()));
    }
    Type type = result->type.kind == TypeKind::Any ? common_type_for(values) : result->type;
    return Materialized{.values = std::move(values), .type = std::move(type), .constant = false};
}

auto Table::materialize(const std::string& name, const RowFunction& fn) const -> Materialized {
    std::vector<Value> values;
    values.reserve(rows_.size());
    for (const auto& row : rows_) {
        values.push_back(fn(*this, row, name));
    }
    Type type = common_type_for(values);
    return Materialized{.values = std::move(values), .type = std::move(type), .constant = false};
}

auto Table::materialize(const std::string& name, std::vector<Value> values) const -> Materialized {
    if (values.size() != rows_.size()) {
        throw ShapeMismatch(fmt::format(
            "length of new column {} ({}) does not fit number of rows {} in table", name,
            values.size(), rows_.size()));
    }
    values = convert_to_common_type(std::move(values));
    Type type = common_type_for(values);
    return Materialized{.values = std::move(values), .type = std::move(type), .constant = false};
}

auto Table::materialize_constant(Value value) const -> Materialized {
    Type type = type_of(value);
    return Materialized{
        .values = std::vector<Value>(rows_.size(), value), .type = std::move(type), .constant = true};
}

void Table::check_new_name(const std::string& name) const {
    if (name.find(kPostfixSeparator) != std::string::npos) {
        throw SchemaError(fmt::format("double underscore in {} not allowed", name));
    }
    if (has_column(name)) {
        throw NameCollisionError(fmt::format("column with name {} already exists", name));
    }
}

void Table::add_constant_column(const std::string& name, Value value, ColumnSpec spec) {
    check_new_name(name);
    insert_column(name, materialize_constant(std::move(value)), std::move(spec));
}

auto Table::resolve_position(const ColumnSpec& spec) const -> std::size_t {
    if (spec.insert_before.has_value() && spec.insert_after.has_value()) {
        throw ArgumentError("can not handle insert_before and insert_after at the same time");
    }
    auto n = static_cast<long>(columns_.size());
    auto resolve = [&](const ColumnPosition& position) -> long {
        if (const auto* name = std::get_if<std::string>(&position)) {
            return static_cast<long>(columns_.index_of(*name));
        }
        long index = std::get<int>(position);
        if (index < 0) {
            index += n;
        }
        return index;
    };
    long position = n;
    if (spec.insert_before.has_value()) {
        position = resolve(*spec.insert_before);
    } else if (spec.insert_after.has_value()) {
        position = resolve(*spec.insert_after) + 1;
    }
    return static_cast<std::size_t>(std::clamp(position, 0L, n));
}

void Table::insert_column(const std::string& name, Materialized column, ColumnSpec spec) {
    Type type = spec.type.value_or(column.type);
    Format format = spec.format;
    if (format.has_value() && format->empty()) {
        format = guess_format(name, type);
    }
    auto position = resolve_position(spec);
    columns_.insert(position, name, std::move(type), std::move(format));
    auto offset = static_cast<std::ptrdiff_t>(position);
    for (std::size_t i = 0; i < rows_.size(); ++i) {
        rows_[i].insert(rows_[i].begin() + offset, std::move(column.values[i]));
    }
    reset_internals();
}

void Table::replace_values(const std::string& name, Materialized column, ColumnSpec spec) {
    auto index = columns_.index_of(name);
    Type type = spec.type.value_or(column.type);
    Format format = spec.format;
    if (format.has_value() && format->empty()) {
        format = guess_format(name, type);
    }
    columns_.set_type(name, std::move(type));
    columns_.set_format(name, std::move(format));
    for (std::size_t i = 0; i < rows_.size(); ++i) {
        rows_[i][index] = std::move(column.values[i]);
    }
    if (primary_index_ == name) {
        primary_index_.reset();
    }
    reset_internals();
}

void Table::add_enumeration(const std::string& name) {
    std::vector<Value> ids;
    ids.reserve(rows_.size());
    for (std::size_t i = 0; i < rows_.size(); ++i) {
        ids.emplace_back(static_cast<std::int64_t>(i));
    }
    add_column(name, std::move(ids),
               ColumnSpec{.type = Type::integer(), .format = "%d", .insert_before = 0});
}

void Table::drop_columns(const std::vector<std::string>& names) {
    ensure_columns(names);
    std::vector<std::size_t> indices;
    indices.reserve(names.size());
    for (const auto& name : names) {
        indices.push_back(columns_.index_of(name));
        if (primary_index_ == name) {
            primary_index_.reset();
        }
    }
    std::sort(indices.begin(), indices.end());
    indices.erase(std::unique(indices.begin(), indices.end()), indices.end());
    for (auto& row : rows_) {
        for (auto it = indices.rbegin(); it != indices.rend(); ++it) {
            row.erase(row.begin() + static_cast<std::ptrdiff_t>(*it));
        }
    }
    columns_.erase(indices);
    if (columns_.empty()) {
        rows_.clear();
    }
    reset_internals();
}

void Table::rename_columns(const std::map<std::string, std::string>& mapping) {
    columns_.rename(mapping);
    if (primary_index_.has_value()) {
        if (auto it = mapping.find(*primary_index_); it != mapping.end()) {
            primary_index_ = it->second;
        }
    }
    reset_internals();
}

auto Table::extract_columns(const std::vector<std::string>& names) const -> Table {
    ensure_columns(names);
    std::vector<std::size_t> indices;
    std::vector<std::string> out_names;
    std::vector<Type> types;
    std::vector<Format> formats;
    for (const auto& name : names) {
        auto index = columns_.index_of(name);
        indices.push_back(index);
        out_names.push_back(name);
        types.push_back(columns_.type(index));
        formats.push_back(columns_.format(index));
    }
    std::vector<Row> rows;
    rows.reserve(rows_.size());
    for (const auto& row : rows_) {
        Row out;
        out.reserve(indices.size());
        for (auto index : indices) {
            out.push_back(row[index]);
        }
        rows.push_back(std::move(out));
    }
    Table result(Unchecked{}, ColumnRegistry(std::move(out_names), std::move(types), std::move(formats)),
                 std::move(rows), title_, meta_);
    if (primary_index_.has_value() &&
        std::find(names.begin(), names.end(), *primary_index_) != names.end()) {
        result.primary_index_ = primary_index_;
    }
    return result;
}

void Table::remove_postfixes(const std::vector<std::string>& postfixes) {
    std::map<std::string, std::string> mapping;
    for (const auto& name : columns_.names()) {
        std::string stripped = name;
        if (postfixes.empty()) {
            stripped = name.substr(0, name.find(kPostfixSeparator));
        } else {
            for (const auto& postfix : postfixes) {
                if (!postfix.empty() && name.ends_with(postfix)) {
                    stripped = name.substr(0, name.size() - postfix.size());
                    break;
                }
            }
        }
        if (stripped != name) {
            mapping.emplace(name, std::move(stripped));
        }
    }
    columns_.rename_unchecked(mapping);
    if (primary_index_.has_value()) {
        if (auto it = mapping.find(*primary_index_); it != mapping.end()) {
            primary_index_ = it->second;
        }
    }
    reset_internals();
}

void Table::rename_postfixes(const std::map<std::string, std::string>& mapping) {
    std::map<std::string, std::string> collected;
    for (const auto& [old_postfix, new_postfix] : mapping) {
        for (const auto& name : columns_.names()) {
            if (!name.ends_with(old_postfix)) {
                continue;
            }
            auto renamed = name.substr(0, name.size() - old_postfix.size()) + new_postfix;
            if (renamed.find(kPostfixSeparator) != std::string::npos) {
                throw SchemaError(
                    fmt::format("renaming {} results in double underscore in {}", name, renamed));
            }
            collected[name] = renamed;
        }
    }
    rename_columns(collected);
}

auto Table::supported_postfixes(const std::vector<std::string>& prefixes) const
    -> std::vector<std::string> {
    std::map<std::string, std::size_t> counter;
    for (const auto& prefix : std::set<std::string>(prefixes.begin(), prefixes.end())) {
        std::set<std::string> seen;
        for (const auto& name : columns_.names()) {
            if (name.starts_with(prefix)) {
                seen.insert(name.substr(prefix.size()));
            }
        }
        for (const auto& postfix : seen) {
            ++counter[postfix];
        }
    }
    auto wanted = std::set<std::string>(prefixes.begin(), prefixes.end()).size();
    std::vector<std::string> supported;
    for (const auto& [postfix, count] : counter) {
        if (count == wanted) {
            supported.push_back(postfix);
        }
    }
    return supported;
}

auto Table::find_postfixes() const -> std::set<std::string> {
    std::set<std::string> out;
    for (const auto& name : columns_.names()) {
        if (auto parsed = parse_postfix(name)) {
            out.insert(parsed->tag);
        }
    }
    return out;
}

auto Table::min_postfix() const -> int { return postfix_range(columns_.names()).first; }

auto Table::max_postfix() const -> int { return postfix_range(columns_.names()).second; }

}  // namespace tabula
