#include <tabula/core/format.hpp>

#include <fmt/format.h>
#include <fmt/printf.h>

namespace tabula {

namespace {

// Conversion character of a single printf style directive, skipping "%%".
auto conversion_of(const std::string& format) -> char {
    for (std::size_t i = 0; i < format.size(); ++i) {
        if (format[i] != '%') {
            continue;
        }
        if (i + 1 < format.size() && format[i + 1] == '%') {
            ++i;
            continue;
        }
        for (std::size_t j = i + 1; j < format.size(); ++j) {
            char c = format[j];
            if (std::string_view("diouxXeEfFgGcsr").find(c) != std::string_view::npos) {
                return c;
            }
        }
        return '\0';
    }
    return '\0';
}

auto printf_format(const Value& value, const std::string& format) -> std::string {
    char conv = conversion_of(format);
    switch (conv) {
        case 'd':
        case 'i':
        case 'o':
        case 'u':
        case 'x':
        case 'X':
            if (!value.is_number()) {
                return "";
            }
            if (value.is_float()) {
                return fmt::sprintf(format, static_cast<long long>(value.as_float()));
            }
            return fmt::sprintf(format, static_cast<long long>(value.as_int()));
        case 'e':
        case 'E':
        case 'f':
        case 'F':
        case 'g':
        case 'G':
            if (!value.is_number()) {
                return "";
            }
            return fmt::sprintf(format, value.as_float());
        case 'r': {
            auto pos = format.find('r');
            std::string adjusted = format;
            adjusted[pos] = 's';
            return fmt::sprintf(adjusted, value.repr());
        }
        case 's':
        case 'c':
            return fmt::sprintf(format, value.to_string());
        default:
            return fmt::sprintf(format);
    }
}

}  // namespace

auto default_format(const Type& type) -> std::string {
    switch (type.kind) {
        case TypeKind::Int:
            return "%d";
        case TypeKind::Float:
            return "%.2f";
        case TypeKind::Str:
            return "%s";
        default:
            return "%r";
    }
}

auto guess_format(std::string_view name, const Type& type) -> std::string {
    if (type.kind == TypeKind::Int || type.kind == TypeKind::Float) {
        if (name.starts_with("m")) {
            return "%.5f";
        }
        if (name.starts_with("rt")) {
            return std::string(kMinutesFormat);
        }
    }
    return default_format(type);
}

auto format_value(const Value& value, const std::string& format) -> std::string {
    if (value.is_none()) {
        return "-";
    }
    if (format == kMinutesFormat) {
        if (!value.is_number()) {
            return value.to_string();
        }
        return fmt::format("{:.2f}m", value.as_float() / 60.0);
    }
    if (format.starts_with("%")) {
        try {
            return printf_format(value, format);
        } catch (const fmt::format_error&) {
            return "";
        }
    }
    try {
        if (value.is_int()) {
            return fmt::format(fmt::runtime(format), value.as_int());
        }
        if (value.is_float()) {
            return fmt::format(fmt::runtime(format), value.as_float());
        }
        return fmt::format(fmt::runtime(format), value.to_string());
    } catch (const fmt::format_error&) {
        return "";
    }
}

auto make_formatter(const Format& format) -> Formatter {
    if (!format.has_value()) {
        return [](const Value&) { return std::string(); };
    }
    return [format = *format](const Value& value) { return format_value(value, format); };
}

}  // namespace tabula
