#include <tabula/core/error.hpp>
#include <tabula/core/object_registry.hpp>
#include <tabula/io/codec.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <bit>
#include <concepts>
#include <cstdint>
#include <type_traits>
#include <variant>

namespace tabula::io {

namespace {

constexpr std::uint8_t kStrictMagic = 'T';
constexpr std::uint8_t kLegacyMagic = 'D';
constexpr std::uint32_t kStrictFields = 6;

enum class ValueTag : std::uint8_t {
    None = 0,
    Bool = 1,
    Int = 2,
    Float = 3,
    Str = 4,
    Object = 5,
};

enum class KeyTag : std::uint8_t {
    Name = 0,
    Ref = 1,
};

enum class EntryTag : std::uint8_t {
    Value = 0,
    Nested = 1,
};

// Fixed-width integers are stored little-endian.
template <std::unsigned_integral T>
void append_raw(std::string& buffer, T value) {
    std::array<char, sizeof(T)> bytes{};
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        bytes[i] = static_cast<char>((value >> (8 * i)) & 0xffU);
    }
    buffer.append(bytes.data(), bytes.size());
}

template <std::unsigned_integral T>
auto read_raw(std::string_view bytes) -> T {
    T value = 0;
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        value |= static_cast<T>(static_cast<unsigned char>(bytes[i])) << (8 * i);
    }
    return value;
}

auto checked_u32(std::size_t n, std::string_view what) -> std::uint32_t {
    if (n > UINT32_MAX) {
        throw ArgumentError(fmt::format("{} too large to store: {}", what, n));
    }
    return static_cast<std::uint32_t>(n);
}

void put_names(Writer& w, const std::vector<std::string>& names) {
    w.put_u32(checked_u32(names.size(), "column count"));
    for (const auto& name : names) {
        w.put_string(name);
    }
}

void put_types(Writer& w, const std::vector<Type>& types) {
    w.put_u32(checked_u32(types.size(), "column count"));
    for (const auto& type : types) {
        w.put_string(to_string(type));
    }
}

void put_formats(Writer& w, const std::vector<Format>& formats) {
    w.put_u32(checked_u32(formats.size(), "column count"));
    for (const auto& format : formats) {
        w.put_optional(format);
    }
}

void put_rows(Writer& w, const std::vector<Row>& rows) {
    w.put_u64(rows.size());
    for (const auto& row : rows) {
        w.put_u32(checked_u32(row.size(), "row length"));
        for (const auto& value : row) {
            w.put_value(value);
        }
    }
}

auto get_names(Reader& r) -> std::vector<std::string> {
    auto n = r.get_u32();
    std::vector<std::string> names;
    for (std::uint32_t i = 0; i < n; ++i) {
        names.push_back(r.get_string());
    }
    return names;
}

auto get_types(Reader& r) -> std::vector<Type> {
    auto n = r.get_u32();
    std::vector<Type> types;
    for (std::uint32_t i = 0; i < n; ++i) {
        types.push_back(parse_type(r.get_string()));
    }
    return types;
}

auto get_formats(Reader& r) -> std::vector<Format> {
    auto n = r.get_u32();
    std::vector<Format> formats;
    for (std::uint32_t i = 0; i < n; ++i) {
        formats.push_back(r.get_optional());
    }
    return formats;
}

auto get_rows(Reader& r) -> std::vector<Row> {
    auto n = r.get_u64();
    // every row takes at least its length field
    if (n > r.remaining() / sizeof(std::uint32_t)) {
        throw LoadError(fmt::format("row count {} exceeds payload size", n));
    }
    std::vector<Row> rows;
    rows.reserve(static_cast<std::size_t>(n));
    for (std::uint64_t i = 0; i < n; ++i) {
        auto width = r.get_u32();
        Row row;
        row.reserve(std::min<std::size_t>(width, r.remaining()));
        for (std::uint32_t j = 0; j < width; ++j) {
            row.push_back(r.get_value());
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

void check_schema(const TablePayload& payload) {
    if (payload.names.size() != payload.types.size() ||
        payload.names.size() != payload.formats.size()) {
        throw LoadError(fmt::format("inconsistent schema: {} names, {} types, {} formats",
                                    payload.names.size(), payload.types.size(),
                                    payload.formats.size()));
    }
}

template <typename Fn>
auto decode_field(const std::string& content, Fn&& fn) {
    Reader r(content);
    auto result = fn(r);
    r.expect_end();
    return result;
}

}  // namespace

void Writer::put_u8(std::uint8_t value) { buffer_.push_back(static_cast<char>(value)); }

void Writer::put_u32(std::uint32_t value) { append_raw(buffer_, value); }

void Writer::put_u64(std::uint64_t value) { append_raw(buffer_, value); }

void Writer::put_f64(double value) { append_raw(buffer_, std::bit_cast<std::uint64_t>(value)); }

void Writer::put_string(std::string_view value) {
    put_u32(checked_u32(value.size(), "string length"));
    buffer_.append(value);
}

void Writer::put_optional(const std::optional<std::string>& value) {
    put_u8(value.has_value() ? 1 : 0);
    if (value.has_value()) {
        put_string(*value);
    }
}

void Writer::put_value(const Value& value) {
    std::visit(
        [&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                put_u8(static_cast<std::uint8_t>(ValueTag::None));
            } else if constexpr (std::is_same_v<T, bool>) {
                put_u8(static_cast<std::uint8_t>(ValueTag::Bool));
                put_u8(v ? 1 : 0);
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                put_u8(static_cast<std::uint8_t>(ValueTag::Int));
                put_u64(static_cast<std::uint64_t>(v));
            } else if constexpr (std::is_same_v<T, double>) {
                put_u8(static_cast<std::uint8_t>(ValueTag::Float));
                put_f64(v);
            } else if constexpr (std::is_same_v<T, std::string>) {
                put_u8(static_cast<std::uint8_t>(ValueTag::Str));
                put_string(v);
            } else {
                put_u8(static_cast<std::uint8_t>(ValueTag::Object));
                put_string(v->type_name());
                put_string(v->encode());
            }
        },
        value.storage());
}

void Writer::put_meta(const Meta& meta) {
    put_u32(checked_u32(meta.size(), "meta size"));
    for (const auto& [key, value] : meta.entries()) {
        if (const auto* name = std::get_if<std::string>(&key)) {
            put_u8(static_cast<std::uint8_t>(KeyTag::Name));
            put_string(*name);
        } else {
            put_u8(static_cast<std::uint8_t>(KeyTag::Ref));
            put_u64(std::get<TableRef>(key).id);
        }
        if (const auto* nested = std::get_if<std::shared_ptr<const Meta>>(&value)) {
            put_u8(static_cast<std::uint8_t>(EntryTag::Nested));
            put_u8(*nested ? 1 : 0);
            if (*nested) {
                put_meta(**nested);
            }
        } else {
            put_u8(static_cast<std::uint8_t>(EntryTag::Value));
            put_value(std::get<Value>(value));
        }
    }
}

auto Reader::take(std::size_t n) -> std::string_view {
    if (n > remaining()) {
        throw LoadError(fmt::format("unexpected end of data: need {} bytes at offset {}, have {}",
                                    n, pos_, remaining()));
    }
    auto out = data_.substr(pos_, n);
    pos_ += n;
    return out;
}

auto Reader::get_u8() -> std::uint8_t { return static_cast<std::uint8_t>(take(1)[0]); }

auto Reader::get_u32() -> std::uint32_t { return read_raw<std::uint32_t>(take(sizeof(std::uint32_t))); }

auto Reader::get_u64() -> std::uint64_t { return read_raw<std::uint64_t>(take(sizeof(std::uint64_t))); }

auto Reader::get_f64() -> double {
    return std::bit_cast<double>(read_raw<std::uint64_t>(take(sizeof(std::uint64_t))));
}

auto Reader::get_string() -> std::string {
    auto n = get_u32();
    return std::string(take(n));
}

auto Reader::get_optional() -> std::optional<std::string> {
    auto present = get_u8();
    if (present > 1) {
        throw LoadError(fmt::format("invalid optional marker {}", present));
    }
    if (present == 0) {
        return std::nullopt;
    }
    return get_string();
}

auto Reader::get_value() -> Value {
    auto tag = get_u8();
    switch (static_cast<ValueTag>(tag)) {
        case ValueTag::None:
            return Value{};
        case ValueTag::Bool:
            return Value(get_u8() != 0);
        case ValueTag::Int:
            return Value(static_cast<std::int64_t>(get_u64()));
        case ValueTag::Float:
            return Value(get_f64());
        case ValueTag::Str:
            return Value(get_string());
        case ValueTag::Object: {
            auto type_name = get_string();
            auto payload = get_string();
            auto object = ObjectRegistry::global().decode(type_name, payload);
            if (!object) {
                throw LoadError(fmt::format("decoder for {} returned no object", type_name));
            }
            auto key = fmt::format("{}:{}", type_name, object->unique_id());
            auto [it, inserted] = objects_.try_emplace(std::move(key), object);
            return Value(it->second);
        }
    }
    throw LoadError(fmt::format("invalid value tag {}", tag));
}

auto Reader::get_meta() -> Meta {
    Meta meta;
    auto n = get_u32();
    for (std::uint32_t i = 0; i < n; ++i) {
        MetaKey key;
        auto key_tag = get_u8();
        switch (static_cast<KeyTag>(key_tag)) {
            case KeyTag::Name:
                key = get_string();
                break;
            case KeyTag::Ref: {
                auto stored = get_u64();
                auto it = refs_.find(stored);
                if (it == refs_.end()) {
                    it = refs_.emplace(stored, TableRef::next()).first;
                }
                key = it->second;
                break;
            }
            default:
                throw LoadError(fmt::format("invalid meta key tag {}", key_tag));
        }
        auto entry_tag = get_u8();
        switch (static_cast<EntryTag>(entry_tag)) {
            case EntryTag::Value:
                meta.set(std::move(key), get_value());
                break;
            case EntryTag::Nested: {
                std::shared_ptr<const Meta> nested;
                if (get_u8() != 0) {
                    nested = std::make_shared<const Meta>(get_meta());
                }
                meta.set(std::move(key), std::move(nested));
                break;
            }
            default:
                throw LoadError(fmt::format("invalid meta entry tag {}", entry_tag));
        }
    }
    return meta;
}

void Reader::expect_end() const {
    if (!at_end()) {
        throw LoadError(fmt::format("{} unexpected trailing bytes", remaining()));
    }
}

auto encode_payload(const TablePayload& payload) -> std::string {
    Writer w;
    w.put_u8(kStrictMagic);
    w.put_u32(kStrictFields);
    put_names(w, payload.names);
    put_types(w, payload.types);
    put_formats(w, payload.formats);
    w.put_optional(payload.title);
    w.put_meta(payload.meta);
    put_rows(w, payload.rows);
    return w.take();
}

auto decode_strict(std::string_view data) -> TablePayload {
    Reader r(data);
    if (r.get_u8() != kStrictMagic) {
        throw LoadError("data is not a table tuple");
    }
    if (auto fields = r.get_u32(); fields != kStrictFields) {
        throw LoadError(
            fmt::format("table tuple has {} items, expected {}", fields, kStrictFields));
    }
    TablePayload payload;
    payload.names = get_names(r);
    payload.types = get_types(r);
    payload.formats = get_formats(r);
    payload.title = r.get_optional();
    payload.meta = r.get_meta();
    payload.rows = get_rows(r);
    r.expect_end();
    check_schema(payload);
    return payload;
}

auto encode_legacy(const std::map<std::string, std::string>& fields) -> std::string {
    Writer w;
    w.put_u8(kLegacyMagic);
    w.put_u32(checked_u32(fields.size(), "field count"));
    for (const auto& [name, content] : fields) {
        w.put_string(name);
        w.put_string(content);
    }
    return w.take();
}

auto decode_legacy(std::string_view data) -> TablePayload {
    Reader r(data);
    if (r.get_u8() != kLegacyMagic) {
        throw LoadError("data is not a table record");
    }
    std::map<std::string, std::string> fields;
    auto n = r.get_u32();
    for (std::uint32_t i = 0; i < n; ++i) {
        auto name = r.get_string();
        fields.insert_or_assign(std::move(name), r.get_string());
    }
    r.expect_end();

    const std::array<std::string, 3> old_names{"colNames", "colTypes", "colFormats"};
    std::size_t old_count = 0;
    for (const auto& name : old_names) {
        old_count += fields.contains(name) ? 1 : 0;
    }
    if (old_count > 0) {
        if (old_count != old_names.size()) {
            throw LoadError("can not load table, internal mismatch");
        }
        for (const auto& name : old_names) {
            auto node = fields.extract(name);
            fields.insert_or_assign("_" + name, std::move(node.mapped()));
        }
    }

    auto require = [&](const std::string& name) -> const std::string& {
        auto it = fields.find(name);
        if (it == fields.end()) {
            throw LoadError(fmt::format("table record lacks field {}", name));
        }
        return it->second;
    };

    TablePayload payload;
    payload.names = decode_field(require("_colNames"), get_names);
    payload.types = decode_field(require("_colTypes"), get_types);
    payload.formats = decode_field(require("_colFormats"), get_formats);
    payload.rows = decode_field(require("rows"), get_rows);
    if (auto it = fields.find("title"); it != fields.end()) {
        payload.title = decode_field(it->second, [](Reader& fr) { return fr.get_optional(); });
    }
    if (auto it = fields.find("meta"); it != fields.end()) {
        payload.meta = decode_field(it->second, [](Reader& fr) { return fr.get_meta(); });
    }
    check_schema(payload);
    return payload;
}

auto encode_names(const std::vector<std::string>& names) -> std::string {
    Writer w;
    put_names(w, names);
    return w.take();
}

auto encode_types(const std::vector<Type>& types) -> std::string {
    Writer w;
    put_types(w, types);
    return w.take();
}

auto encode_formats(const std::vector<Format>& formats) -> std::string {
    Writer w;
    put_formats(w, formats);
    return w.take();
}

auto encode_title(const std::optional<std::string>& title) -> std::string {
    Writer w;
    w.put_optional(title);
    return w.take();
}

auto encode_meta(const Meta& meta) -> std::string {
    Writer w;
    w.put_meta(meta);
    return w.take();
}

auto encode_rows(const std::vector<Row>& rows) -> std::string {
    Writer w;
    put_rows(w, rows);
    return w.take();
}

}  // namespace tabula::io
