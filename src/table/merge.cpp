#include <tabula/core/error.hpp>
#include <tabula/table/merge.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <optional>

namespace tabula {

namespace {

struct MergedSchema {
    std::vector<std::string> names;
    std::vector<Type> types;
    std::vector<Format> formats;
};

auto describe(const Format& format) -> std::string {
    return format.has_value() ? fmt::format("'{}'", *format) : "None";
}

auto infer_schema(const std::vector<Table>& tables, bool force_merge) -> MergedSchema {
    MergedSchema schema;
    for (const auto& table : tables) {
        for (std::size_t i = 0; i < table.num_columns(); ++i) {
            const auto& name = table.columns().name(i);
            const auto& type = table.columns().type(i);
            const auto& format = table.columns().format(i);
            auto it = std::find(schema.names.begin(), schema.names.end(), name);
            if (it == schema.names.end()) {
                schema.names.push_back(name);
                schema.types.push_back(type);
                schema.formats.push_back(format);
                continue;
            }
            if (force_merge) {
                continue;
            }
            auto index = static_cast<std::size_t>(it - schema.names.begin());
            if (schema.types[index] != type) {
                throw SchemaError(fmt::format("column {} has conflicting types {} and {}", name,
                                              to_string(schema.types[index]), to_string(type)));
            }
            if (schema.formats[index] != format) {
                throw SchemaError(fmt::format("column {} has conflicting formats {} and {}", name,
                                              describe(schema.formats[index]), describe(format)));
            }
        }
    }
    if (force_merge) {
        return schema;
    }
    for (const auto& table : tables) {
        std::optional<std::size_t> last;
        for (const auto& name : table.column_names()) {
            auto index = static_cast<std::size_t>(
                std::find(schema.names.begin(), schema.names.end(), name) - schema.names.begin());
            if (last.has_value() && index < *last) {
                throw SchemaError(fmt::format(
                    "column order [{}] conflicts with merged order [{}]",
                    fmt::join(table.column_names(), ", "), fmt::join(schema.names, ", ")));
            }
            last = index;
        }
    }
    return schema;
}

auto reference_schema(const Table& reference, const std::vector<Table>& tables, bool force_merge)
    -> MergedSchema {
    MergedSchema schema{reference.column_names(), reference.column_types(),
                        reference.column_formats()};
    if (force_merge) {
        return schema;
    }
    for (const auto& table : tables) {
        for (std::size_t i = 0; i < schema.names.size(); ++i) {
            auto index = table.columns().find(schema.names[i]);
            if (index && table.columns().type(*index) != schema.types[i]) {
                throw SchemaError(fmt::format(
                    "column {} has type {}, reference table has {}", schema.names[i],
                    to_string(table.columns().type(*index)), to_string(schema.types[i])));
            }
        }
    }
    return schema;
}

}  // namespace

auto merge_tables(const std::vector<Table>& tables, const Table* reference, bool force_merge)
    -> Table {
    if (tables.empty()) {
        throw ArgumentError("merge_tables needs at least one table");
    }
    auto schema = reference != nullptr ? reference_schema(*reference, tables, force_merge)
                                       : infer_schema(tables, force_merge);

    std::vector<Row> rows;
    for (const auto& table : tables) {
        std::vector<std::optional<std::size_t>> source;
        source.reserve(schema.names.size());
        for (const auto& name : schema.names) {
            source.push_back(table.columns().find(name));
        }
        for (const auto& row : table.rows()) {
            Row merged;
            merged.reserve(source.size());
            for (const auto& index : source) {
                merged.push_back(index ? row[*index] : Value{});
            }
            rows.push_back(std::move(merged));
        }
    }

    const auto& first = tables.front();
    return Table::create(std::move(schema.names), std::move(schema.types),
                         std::move(schema.formats), std::move(rows), first.title(), first.meta());
}

}  // namespace tabula
