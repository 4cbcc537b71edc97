#pragma once

#include <tabula/core/format.hpp>
#include <tabula/core/meta.hpp>
#include <tabula/core/value.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tabula::io {

/// First line of every stored table file.
inline constexpr std::string_view kVersionHeader = "emzed_version=2.0.2";
inline constexpr std::string_view kVersionPrefix = "emzed_version=";

/// Plain data of a table, as written to and read from disk.
struct TablePayload {
    std::vector<std::string> names;
    std::vector<Type> types;
    std::vector<Format> formats;
    std::optional<std::string> title;
    Meta meta;
    std::vector<Row> rows;
};

/// Appends fixed-width and length-prefixed fields to a byte buffer.
class Writer {
   public:
    void put_u8(std::uint8_t value);
    void put_u32(std::uint32_t value);
    void put_u64(std::uint64_t value);
    void put_f64(double value);
    void put_string(std::string_view value);
    void put_optional(const std::optional<std::string>& value);
    void put_value(const Value& value);
    void put_meta(const Meta& meta);

    [[nodiscard]] auto data() const noexcept -> const std::string& { return buffer_; }
    [[nodiscard]] auto take() noexcept -> std::string { return std::move(buffer_); }

   private:
    std::string buffer_;
};

/// Reads what Writer wrote; every truncated or malformed field throws LoadError.
///
/// Table identities stored as meta keys are mapped to fresh identities, one
/// per stored identity. Object cells with the same content are decoded to
/// one shared instance.
class Reader {
   public:
    explicit Reader(std::string_view data) : data_(data) {}

    [[nodiscard]] auto get_u8() -> std::uint8_t;
    [[nodiscard]] auto get_u32() -> std::uint32_t;
    [[nodiscard]] auto get_u64() -> std::uint64_t;
    [[nodiscard]] auto get_f64() -> double;
    [[nodiscard]] auto get_string() -> std::string;
    [[nodiscard]] auto get_optional() -> std::optional<std::string>;
    [[nodiscard]] auto get_value() -> Value;
    [[nodiscard]] auto get_meta() -> Meta;

    [[nodiscard]] auto remaining() const noexcept -> std::size_t { return data_.size() - pos_; }
    [[nodiscard]] auto at_end() const noexcept -> bool { return pos_ == data_.size(); }
    /// Throws LoadError if unread bytes are left.
    void expect_end() const;

   private:
    [[nodiscard]] auto take(std::size_t n) -> std::string_view;

    std::string_view data_;
    std::size_t pos_ = 0;
    std::map<std::uint64_t, TableRef> refs_;
    std::map<std::string, ObjectPtr> objects_;
};

/// Current format: a fixed tuple (names, types, formats, title, meta, rows).
[[nodiscard]] auto encode_payload(const TablePayload& payload) -> std::string;
[[nodiscard]] auto decode_strict(std::string_view data) -> TablePayload;

/// Older format: a record of named fields. Accepts the field names
/// colNames/colTypes/colFormats (all three or none) as well as
/// _colNames/_colTypes/_colFormats.
[[nodiscard]] auto encode_legacy(const std::map<std::string, std::string>& fields) -> std::string;
[[nodiscard]] auto decode_legacy(std::string_view data) -> TablePayload;

/// Field encoders for building legacy records.
[[nodiscard]] auto encode_names(const std::vector<std::string>& names) -> std::string;
[[nodiscard]] auto encode_types(const std::vector<Type>& types) -> std::string;
[[nodiscard]] auto encode_formats(const std::vector<Format>& formats) -> std::string;
[[nodiscard]] auto encode_title(const std::optional<std::string>& title) -> std::string;
[[nodiscard]] auto encode_meta(const Meta& meta) -> std::string;
[[nodiscard]] auto encode_rows(const std::vector<Row>& rows) -> std::string;

}  // namespace tabula::io
