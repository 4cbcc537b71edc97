#include <tabula/core/error.hpp>
#include <tabula/core/value.hpp>

#include <fmt/format.h>

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <functional>

namespace tabula {

auto hash_combine(std::size_t seed, std::size_t value) -> std::size_t {
    return seed ^ (value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
}

namespace {

// None, numbers, strings, objects
auto order_rank(const Value& value) -> int {
    if (value.is_none()) {
        return 0;
    }
    if (value.is_number()) {
        return 1;
    }
    if (value.is_string()) {
        return 2;
    }
    return 3;
}

auto format_float(double value) -> std::string {
    if (std::isnan(value)) {
        return "nan";
    }
    if (std::isinf(value)) {
        return value > 0 ? "inf" : "-inf";
    }
    auto text = fmt::format("{}", value);
    if (text.find_first_of(".e") == std::string::npos) {
        text += ".0";
    }
    return text;
}

auto parse_int(std::string_view text) -> std::optional<std::int64_t> {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
    }
    std::int64_t out = 0;
    const auto* begin = text.data();
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, out);
    if (ec != std::errc{} || ptr != end || begin == end) {
        return std::nullopt;
    }
    return out;
}

auto parse_float(const std::string& text) -> std::optional<double> {
    const char* begin = text.c_str();
    char* end = nullptr;
    double value = std::strtod(begin, &end);
    if (end == begin) {
        return std::nullopt;
    }
    while (*end != '\0' && std::isspace(static_cast<unsigned char>(*end))) {
        ++end;
    }
    if (*end != '\0') {
        return std::nullopt;
    }
    return value;
}

}  // namespace

auto Value::as_bool() const -> bool {
    if (const auto* v = std::get_if<bool>(&storage_)) {
        return *v;
    }
    throw TypeError(fmt::format("value {} is not a bool", repr()));
}

auto Value::as_int() const -> std::int64_t {
    if (const auto* v = std::get_if<std::int64_t>(&storage_)) {
        return *v;
    }
    if (const auto* v = std::get_if<bool>(&storage_)) {
        return *v ? 1 : 0;
    }
    throw TypeError(fmt::format("value {} is not an int", repr()));
}

auto Value::as_float() const -> double {
    if (const auto* v = std::get_if<double>(&storage_)) {
        return *v;
    }
    if (const auto* v = std::get_if<std::int64_t>(&storage_)) {
        return static_cast<double>(*v);
    }
    if (const auto* v = std::get_if<bool>(&storage_)) {
        return *v ? 1.0 : 0.0;
    }
    throw TypeError(fmt::format("value {} is not a number", repr()));
}

auto Value::as_string() const -> const std::string& {
    if (const auto* v = std::get_if<std::string>(&storage_)) {
        return *v;
    }
    throw TypeError(fmt::format("value {} is not a string", repr()));
}

auto Value::as_object() const -> const ObjectPtr& {
    if (const auto* v = std::get_if<ObjectPtr>(&storage_)) {
        return *v;
    }
    throw TypeError(fmt::format("value {} is not an object", repr()));
}

auto Value::truthy() const -> bool {
    return std::visit(
        [](const auto& v) -> bool {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return false;
            } else if constexpr (std::is_same_v<T, bool>) {
                return v;
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                return v != 0;
            } else if constexpr (std::is_same_v<T, double>) {
                return v != 0.0;
            } else if constexpr (std::is_same_v<T, std::string>) {
                return !v.empty();
            } else {
                return true;
            }
        },
        storage_);
}

auto Value::to_string() const -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return "None";
            } else if constexpr (std::is_same_v<T, bool>) {
                return v ? "True" : "False";
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                return fmt::format("{}", v);
            } else if constexpr (std::is_same_v<T, double>) {
                return format_float(v);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else {
                return v->to_string();
            }
        },
        storage_);
}

auto Value::repr() const -> std::string {
    if (const auto* v = std::get_if<std::string>(&storage_)) {
        return fmt::format("'{}'", *v);
    }
    return to_string();
}

auto operator==(const Value& lhs, const Value& rhs) -> bool {
    if (lhs.is_number() && rhs.is_number()) {
        if (lhs.is_float() || rhs.is_float()) {
            return lhs.as_float() == rhs.as_float();
        }
        return lhs.as_int() == rhs.as_int();
    }
    if (lhs.storage_.index() != rhs.storage_.index()) {
        return false;
    }
    if (lhs.is_object()) {
        const auto& a = lhs.as_object();
        const auto& b = rhs.as_object();
        return a == b || a->equals(*b);
    }
    return lhs.storage_ == rhs.storage_;
}

auto compare_values(const Value& lhs, const Value& rhs) -> int {
    int lrank = order_rank(lhs);
    int rrank = order_rank(rhs);
    if (lrank != rrank) {
        return lrank < rrank ? -1 : 1;
    }
    switch (lrank) {
        case 0:
            return 0;
        case 1: {
            if (!lhs.is_float() && !rhs.is_float()) {
                auto a = lhs.as_int();
                auto b = rhs.as_int();
                return a < b ? -1 : (b < a ? 1 : 0);
            }
            double a = lhs.as_float();
            double b = rhs.as_float();
            return a < b ? -1 : (b < a ? 1 : 0);
        }
        case 2: {
            int c = lhs.as_string().compare(rhs.as_string());
            return c < 0 ? -1 : (c > 0 ? 1 : 0);
        }
        default: {
            const auto& a = lhs.as_object();
            const auto& b = rhs.as_object();
            if (a == b) {
                return 0;
            }
            int c = a->type_name().compare(b->type_name());
            if (c == 0) {
                c = a->unique_id().compare(b->unique_id());
            }
            return c < 0 ? -1 : (c > 0 ? 1 : 0);
        }
    }
}

auto ValueHash::operator()(const Value& value) const -> std::size_t {
    if (value.is_none()) {
        return 0x5bd1e995ULL;
    }
    if (value.is_number()) {
        double d = value.as_float();
        if (d == 0.0) {
            d = 0.0;
        }
        return std::hash<double>{}(d);
    }
    if (value.is_string()) {
        return std::hash<std::string>{}(value.as_string());
    }
    return value.as_object()->hash();
}

auto RowHash::operator()(const Row& row) const -> std::size_t {
    std::size_t seed = 0;
    for (const auto& value : row) {
        seed = hash_combine(seed, ValueHash{}(value));
    }
    return seed;
}

auto Type::object(std::string name) -> Type {
    if (name.empty()) {
        throw TypeError("object column type requires a type name");
    }
    return {.kind = TypeKind::Object, .name = std::move(name)};
}

auto to_string(const Type& type) -> std::string {
    switch (type.kind) {
        case TypeKind::Any:
            return "object";
        case TypeKind::Bool:
            return "bool";
        case TypeKind::Int:
            return "int";
        case TypeKind::Float:
            return "float";
        case TypeKind::Str:
            return "str";
        case TypeKind::Table:
            return "Table";
        case TypeKind::Blob:
            return "Blob";
        case TypeKind::Object:
            return type.name;
    }
    return "object";
}

auto parse_type(std::string_view name) -> Type {
    if (name == "object" || name.empty()) {
        return Type::any();
    }
    if (name == "bool") {
        return Type::boolean();
    }
    if (name == "int") {
        return Type::integer();
    }
    if (name == "float") {
        return Type::floating();
    }
    if (name == "str") {
        return Type::string();
    }
    if (name == "Table") {
        return Type::table();
    }
    if (name == "Blob") {
        return Type::blob();
    }
    return Type::object(std::string(name));
}

auto type_of(const Value& value) -> Type {
    return std::visit(
        [](const auto& v) -> Type {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return Type::any();
            } else if constexpr (std::is_same_v<T, bool>) {
                return Type::boolean();
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                return Type::integer();
            } else if constexpr (std::is_same_v<T, double>) {
                return Type::floating();
            } else if constexpr (std::is_same_v<T, std::string>) {
                return Type::string();
            } else {
                return parse_type(v->type_name());
            }
        },
        value.storage());
}

auto common_type_for(const std::vector<Value>& values) -> Type {
    std::optional<Type> common;
    for (const auto& value : values) {
        if (value.is_none()) {
            continue;
        }
        Type current = type_of(value);
        if (!common.has_value()) {
            common = current;
            continue;
        }
        if (*common == current) {
            continue;
        }
        if (common->is_numeric() && current.is_numeric()) {
            if (common->kind == TypeKind::Float || current.kind == TypeKind::Float) {
                common = Type::floating();
            } else {
                common = Type::integer();
            }
            continue;
        }
        return Type::any();
    }
    return common.value_or(Type::any());
}

auto coerce(const Value& value, const Type& type) -> Value {
    if (value.is_none()) {
        return value;
    }
    switch (type.kind) {
        case TypeKind::Int: {
            if (value.is_int()) {
                return value;
            }
            if (value.is_bool()) {
                return Value(value.as_int());
            }
            if (value.is_float()) {
                double d = value.as_float();
                // 2^63 is exactly representable; the int64 range is [-2^63, 2^63)
                constexpr double kLimit = 9223372036854775808.0;
                if (!std::isfinite(d) || d < -kLimit || d >= kLimit) {
                    throw TypeError(fmt::format("can not convert {} to int", value.repr()));
                }
                return Value(static_cast<std::int64_t>(d));
            }
            if (value.is_string()) {
                if (auto parsed = parse_int(value.as_string())) {
                    return Value(*parsed);
                }
            }
            throw TypeError(fmt::format("can not convert {} to int", value.repr()));
        }
        case TypeKind::Float: {
            if (value.is_number()) {
                return Value(value.as_float());
            }
            if (value.is_string()) {
                if (auto parsed = parse_float(value.as_string())) {
                    return Value(*parsed);
                }
            }
            throw TypeError(fmt::format("can not convert {} to float", value.repr()));
        }
        case TypeKind::Str:
            if (value.is_string()) {
                return value;
            }
            return Value(value.to_string());
        default:
            return value;
    }
}

auto convert_to_common_type(std::vector<Value> values) -> std::vector<Value> {
    Type common = common_type_for(values);
    if (common.kind != TypeKind::Int && common.kind != TypeKind::Float &&
        common.kind != TypeKind::Str) {
        return values;
    }
    for (auto& value : values) {
        value = coerce(value, common);
    }
    return values;
}

}  // namespace tabula
