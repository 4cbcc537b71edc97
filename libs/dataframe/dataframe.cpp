#include "dataframe.hpp"

#include <tabula/core/blob.hpp>
#include <tabula/core/error.hpp>

#include <fmt/format.h>

#include <cmath>
#include <cstdint>
#include <string_view>
#include <utility>
#include <vector>

namespace tabula::dataframe {

namespace {

void check(const arrow::Status& status, std::string_view what) {
    if (!status.ok()) {
        throw Error(fmt::format("to_arrow: {} failed: {}", what, status.ToString()));
    }
}

template <typename Builder, typename Append>
auto build_array(Builder& builder, const std::vector<Value>& values, Append&& append)
    -> std::shared_ptr<arrow::Array> {
    check(builder.Reserve(static_cast<std::int64_t>(values.size())), "reserve");
    for (const auto& value : values) {
        if (value.is_none()) {
            check(builder.AppendNull(), "append null");
        } else {
            check(append(builder, value), "append");
        }
    }
    std::shared_ptr<arrow::Array> array;
    check(builder.Finish(&array), "finish");
    return array;
}

auto column_to_arrow(const std::string& name, const Type& declared, const std::vector<Value>& values)
    -> std::pair<std::shared_ptr<arrow::Field>, std::shared_ptr<arrow::Array>> {
    Type type = declared.kind == TypeKind::Any ? common_type_for(values) : declared;
    switch (type.kind) {
        case TypeKind::Int: {
            arrow::Int64Builder builder;
            auto array = build_array(builder, values, [](auto& b, const Value& v) {
                return b.Append(v.as_int());
            });
            return {arrow::field(name, arrow::int64()), array};
        }
        case TypeKind::Float: {
            arrow::DoubleBuilder builder;
            auto array = build_array(builder, values, [](auto& b, const Value& v) {
                double d = v.as_float();
                return std::isnan(d) ? b.AppendNull() : b.Append(d);
            });
            return {arrow::field(name, arrow::float64()), array};
        }
        case TypeKind::Bool: {
            arrow::BooleanBuilder builder;
            auto array = build_array(builder, values, [](auto& b, const Value& v) {
                return b.Append(v.as_bool());
            });
            return {arrow::field(name, arrow::boolean()), array};
        }
        case TypeKind::Str: {
            arrow::StringBuilder builder;
            auto array = build_array(builder, values, [](auto& b, const Value& v) {
                return b.Append(std::string_view(v.as_string()));
            });
            return {arrow::field(name, arrow::utf8()), array};
        }
        case TypeKind::Blob: {
            arrow::BinaryBuilder builder;
            auto array = build_array(builder, values, [&name](auto& b, const Value& v) {
                const auto* blob = dynamic_cast<const Blob*>(v.as_object().get());
                if (blob == nullptr) {
                    throw TypeError(fmt::format("column {} holds {}, expected Blob", name,
                                                v.as_object()->type_name()));
                }
                return b.Append(std::string_view(blob->data()));
            });
            return {arrow::field(name, arrow::binary()), array};
        }
        case TypeKind::Any: {
            arrow::NullBuilder builder;
            check(builder.AppendNulls(static_cast<std::int64_t>(values.size())), "append nulls");
            std::shared_ptr<arrow::Array> array;
            check(builder.Finish(&array), "finish");
            return {arrow::field(name, arrow::null()), array};
        }
        default:
            throw TypeError(fmt::format("column {} of type {} has no arrow counterpart", name,
                                        to_string(type)));
    }
}

template <typename ArrayT, typename Convert>
void append_chunks(const arrow::ChunkedArray& chunked, std::vector<Value>& out, Convert&& convert) {
    for (const auto& chunk : chunked.chunks()) {
        auto array = std::static_pointer_cast<ArrayT>(chunk);
        for (std::int64_t i = 0; i < array->length(); ++i) {
            if (array->IsNull(i)) {
                out.emplace_back();
            } else {
                out.push_back(convert(*array, i));
            }
        }
    }
}

auto column_from_arrow(const arrow::Field& field, const arrow::ChunkedArray& chunked)
    -> std::pair<Type, std::vector<Value>> {
    std::vector<Value> values;
    values.reserve(static_cast<std::size_t>(chunked.length()));
    auto integer = [&]<typename ArrayT>() {
        append_chunks<ArrayT>(chunked, values, [](const ArrayT& a, std::int64_t i) {
            return Value(static_cast<std::int64_t>(a.Value(i)));
        });
        return std::pair{Type::integer(), std::move(values)};
    };
    auto floating = [&]<typename ArrayT>() {
        append_chunks<ArrayT>(chunked, values, [](const ArrayT& a, std::int64_t i) {
            auto d = static_cast<double>(a.Value(i));
            return std::isnan(d) ? Value{} : Value(d);
        });
        return std::pair{Type::floating(), std::move(values)};
    };

    switch (field.type()->id()) {
        case arrow::Type::INT8:
            return integer.template operator()<arrow::Int8Array>();
        case arrow::Type::INT16:
            return integer.template operator()<arrow::Int16Array>();
        case arrow::Type::INT32:
            return integer.template operator()<arrow::Int32Array>();
        case arrow::Type::INT64:
            return integer.template operator()<arrow::Int64Array>();
        case arrow::Type::UINT8:
            return integer.template operator()<arrow::UInt8Array>();
        case arrow::Type::UINT16:
            return integer.template operator()<arrow::UInt16Array>();
        case arrow::Type::UINT32:
            return integer.template operator()<arrow::UInt32Array>();
        case arrow::Type::UINT64:
            return integer.template operator()<arrow::UInt64Array>();
        case arrow::Type::FLOAT:
            return floating.template operator()<arrow::FloatArray>();
        case arrow::Type::DOUBLE:
            return floating.template operator()<arrow::DoubleArray>();
        case arrow::Type::BOOL:
            append_chunks<arrow::BooleanArray>(
                chunked, values,
                [](const arrow::BooleanArray& a, std::int64_t i) { return Value(a.Value(i)); });
            return {Type::boolean(), std::move(values)};
        case arrow::Type::STRING:
            append_chunks<arrow::StringArray>(
                chunked, values,
                [](const arrow::StringArray& a, std::int64_t i) { return Value(a.GetString(i)); });
            return {Type::string(), std::move(values)};
        case arrow::Type::LARGE_STRING:
            append_chunks<arrow::LargeStringArray>(
                chunked, values, [](const arrow::LargeStringArray& a, std::int64_t i) {
                    return Value(a.GetString(i));
                });
            return {Type::string(), std::move(values)};
        case arrow::Type::BINARY:
            append_chunks<arrow::BinaryArray>(
                chunked, values, [](const arrow::BinaryArray& a, std::int64_t i) {
                    return Value(Blob::make(a.GetString(i)));
                });
            return {Type::blob(), std::move(values)};
        case arrow::Type::NA:
            values.resize(static_cast<std::size_t>(chunked.length()));
            return {Type::any(), std::move(values)};
        default:
            throw TypeError(fmt::format("column {} has unsupported arrow type {}", field.name(),
                                        field.type()->ToString()));
    }
}

auto default_import_format(const Type& type) -> Format {
    switch (type.kind) {
        case TypeKind::Int:
            return "%d";
        case TypeKind::Float:
            return "%f";
        case TypeKind::Any:
            return std::nullopt;
        default:
            return "%s";
    }
}

}  // namespace

auto to_arrow(const Table& table) -> std::shared_ptr<arrow::Table> {
    std::vector<std::shared_ptr<arrow::Field>> fields;
    std::vector<std::shared_ptr<arrow::Array>> arrays;
    fields.reserve(table.num_columns());
    arrays.reserve(table.num_columns());
    for (std::size_t i = 0; i < table.num_columns(); ++i) {
        const auto& name = table.columns().name(i);
        auto [field, array] = column_to_arrow(name, table.columns().type(i), table.column_values(name));
        fields.push_back(std::move(field));
        arrays.push_back(std::move(array));
    }
    return arrow::Table::Make(arrow::schema(std::move(fields)), arrays,
                              static_cast<std::int64_t>(table.size()));
}

auto from_arrow(const arrow::Table& table, const FromArrowOptions& options) -> Table {
    const auto& schema = table.schema();
    std::vector<std::string> names;
    std::vector<Type> types;
    std::vector<Format> formats;
    std::vector<std::vector<Value>> columns;
    for (int c = 0; c < table.num_columns(); ++c) {
        const auto& field = *schema->field(c);
        auto [type, values] = column_from_arrow(field, *table.column(c));
        if (auto it = options.types.find(field.name()); it != options.types.end()) {
            type = it->second;
            for (auto& value : values) {
                value = coerce(value, type);
            }
        }
        Format format = default_import_format(type);
        if (auto it = options.formats.find(field.name()); it != options.formats.end()) {
            format = it->second;
        } else if (auto jt = options.type_formats.find(type.kind); jt != options.type_formats.end()) {
            format = jt->second;
        }
        names.push_back(field.name());
        types.push_back(std::move(type));
        formats.push_back(std::move(format));
        columns.push_back(std::move(values));
    }

    auto n = static_cast<std::size_t>(table.num_rows());
    std::vector<Row> rows(n);
    for (std::size_t r = 0; r < n; ++r) {
        rows[r].reserve(columns.size());
        for (auto& column : columns) {
            rows[r].push_back(std::move(column[r]));
        }
    }
    return Table::create(std::move(names), std::move(types), std::move(formats), std::move(rows),
                         options.title, options.meta);
}

}  // namespace tabula::dataframe
