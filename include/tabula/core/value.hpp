#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace tabula {

class Object;
using ObjectPtr = std::shared_ptr<const Object>;

/// Capability of an embedded cell object (nested tables, blobs, domain types).
///
/// Objects are immutable once stored in a table, so tables may share them.
class Object {
   public:
    Object() = default;
    virtual ~Object() = default;

    Object(const Object&) = default;
    auto operator=(const Object&) -> Object& = default;
    Object(Object&&) = default;
    auto operator=(Object&&) -> Object& = default;

    /// Name used for column types and for persistence dispatch.
    [[nodiscard]] virtual auto type_name() const -> std::string = 0;
    /// Stable hex digest of the content.
    [[nodiscard]] virtual auto unique_id() const -> std::string = 0;
    [[nodiscard]] virtual auto clone() const -> ObjectPtr = 0;
    [[nodiscard]] virtual auto equals(const Object& other) const -> bool = 0;
    /// Hash over exactly the fields equals() compares.
    [[nodiscard]] virtual auto hash() const -> std::size_t = 0;
    [[nodiscard]] virtual auto to_string() const -> std::string = 0;
    /// Serialized payload, decoded again through the ObjectRegistry.
    [[nodiscard]] virtual auto encode() const -> std::string = 0;
};

/// A single cell: None, bool, int64, float64, string or an object.
class Value {
   public:
    using Storage = std::variant<std::monostate, bool, std::int64_t, double, std::string, ObjectPtr>;

    Value() = default;
    Value(std::nullopt_t) {}
    template <std::same_as<bool> T>
    Value(T value) : storage_(value) {}
    template <std::integral T>
        requires(!std::same_as<T, bool>)
    Value(T value) : storage_(static_cast<std::int64_t>(value)) {}
    template <std::floating_point T>
    Value(T value) : storage_(static_cast<double>(value)) {}
    Value(const char* value) : storage_(std::string(value)) {}
    Value(std::string value) : storage_(std::move(value)) {}
    Value(std::string_view value) : storage_(std::string(value)) {}
    Value(ObjectPtr value) {
        if (value) {
            storage_ = std::move(value);
        }
    }
    template <typename T>
        requires std::derived_from<T, Object>
    Value(std::shared_ptr<T> value) : Value(ObjectPtr(std::move(value))) {}

    [[nodiscard]] auto is_none() const noexcept -> bool {
        return std::holds_alternative<std::monostate>(storage_);
    }
    [[nodiscard]] auto is_bool() const noexcept -> bool {
        return std::holds_alternative<bool>(storage_);
    }
    [[nodiscard]] auto is_int() const noexcept -> bool {
        return std::holds_alternative<std::int64_t>(storage_);
    }
    [[nodiscard]] auto is_float() const noexcept -> bool {
        return std::holds_alternative<double>(storage_);
    }
    /// True for bool, int and float values.
    [[nodiscard]] auto is_number() const noexcept -> bool {
        return is_bool() || is_int() || is_float();
    }
    [[nodiscard]] auto is_string() const noexcept -> bool {
        return std::holds_alternative<std::string>(storage_);
    }
    [[nodiscard]] auto is_object() const noexcept -> bool {
        return std::holds_alternative<ObjectPtr>(storage_);
    }

    [[nodiscard]] auto as_bool() const -> bool;
    [[nodiscard]] auto as_int() const -> std::int64_t;
    /// Numeric value as double; bools and ints are widened.
    [[nodiscard]] auto as_float() const -> double;
    [[nodiscard]] auto as_string() const -> const std::string&;
    [[nodiscard]] auto as_object() const -> const ObjectPtr&;

    /// Truthiness: None, false, 0, 0.0 and "" are falsy.
    [[nodiscard]] auto truthy() const -> bool;

    /// Human readable rendering ("None", "True", "3", "2.5", raw strings).
    [[nodiscard]] auto to_string() const -> std::string;
    /// Like to_string, but strings are quoted.
    [[nodiscard]] auto repr() const -> std::string;

    [[nodiscard]] auto storage() const noexcept -> const Storage& { return storage_; }

    /// Structural equality: numbers compare numerically, objects via Object::equals.
    friend auto operator==(const Value& lhs, const Value& rhs) -> bool;

   private:
    Storage storage_;
};

using Row = std::vector<Value>;

/// Total order used for sorting: None < numbers < strings < objects.
[[nodiscard]] auto compare_values(const Value& lhs, const Value& rhs) -> int;

[[nodiscard]] auto hash_combine(std::size_t seed, std::size_t value) -> std::size_t;

/// Hash consistent with Value equality.
struct ValueHash {
    auto operator()(const Value& value) const -> std::size_t;
};

/// Hash / equality over a sequence of values, used for grouping keys.
struct RowHash {
    auto operator()(const Row& row) const -> std::size_t;
};

struct RowEq {
    auto operator()(const Row& a, const Row& b) const -> bool { return a == b; }
};

enum class TypeKind : std::uint8_t {
    Any,
    Bool,
    Int,
    Float,
    Str,
    Table,
    Blob,
    Object,
};

/// Declared type of a column.
struct Type {
    TypeKind kind = TypeKind::Any;
    /// Object type name, only used with TypeKind::Object.
    std::string name;

    [[nodiscard]] static auto any() -> Type { return {}; }
    [[nodiscard]] static auto boolean() -> Type { return {.kind = TypeKind::Bool}; }
    [[nodiscard]] static auto integer() -> Type { return {.kind = TypeKind::Int}; }
    [[nodiscard]] static auto floating() -> Type { return {.kind = TypeKind::Float}; }
    [[nodiscard]] static auto string() -> Type { return {.kind = TypeKind::Str}; }
    [[nodiscard]] static auto table() -> Type { return {.kind = TypeKind::Table}; }
    [[nodiscard]] static auto blob() -> Type { return {.kind = TypeKind::Blob}; }
    /// Object column type; throws TypeError for an empty name.
    [[nodiscard]] static auto object(std::string name) -> Type;

    [[nodiscard]] auto is_numeric() const noexcept -> bool {
        return kind == TypeKind::Bool || kind == TypeKind::Int || kind == TypeKind::Float;
    }

    friend auto operator==(const Type&, const Type&) -> bool = default;
};

/// Short type name, e.g. "int", "float", "str", "Table".
[[nodiscard]] auto to_string(const Type& type) -> std::string;

/// Parse a name produced by to_string(Type).
[[nodiscard]] auto parse_type(std::string_view name) -> Type;

/// Type of a single value; None yields Any.
[[nodiscard]] auto type_of(const Value& value) -> Type;

/// Common type of a column of values; None cells are ignored.
[[nodiscard]] auto common_type_for(const std::vector<Value>& values) -> Type;

/// Converts a non-None value to Int, Float or Str; other types pass through.
/// Throws TypeError when the conversion is impossible.
[[nodiscard]] auto coerce(const Value& value, const Type& type) -> Value;

/// Converts every non-None value to the common type when it is a basic type.
[[nodiscard]] auto convert_to_common_type(std::vector<Value> values) -> std::vector<Value>;

}  // namespace tabula
