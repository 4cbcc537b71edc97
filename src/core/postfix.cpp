#include <tabula/core/error.hpp>
#include <tabula/core/postfix.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <charconv>

namespace tabula {

auto parse_postfix(std::string_view name) -> std::optional<Postfix> {
    if (name.starts_with(kPostfixSeparator)) {
        return std::nullopt;
    }
    auto pos = name.find(kPostfixSeparator);
    if (pos == std::string_view::npos) {
        return Postfix{.prefix = std::string(name), .tag = "", .number = -1};
    }
    auto rest = name.substr(pos + kPostfixSeparator.size());
    if (rest.find(kPostfixSeparator) != std::string_view::npos) {
        throw SchemaError(fmt::format("invalid column name {}", name));
    }
    Postfix out{.prefix = std::string(name.substr(0, pos)),
                .tag = std::string(name.substr(pos)),
                .number = std::nullopt};
    int number = 0;
    auto [ptr, ec] = std::from_chars(rest.data(), rest.data() + rest.size(), number);
    if (ec == std::errc{} && ptr == rest.data() + rest.size() && !rest.empty() && number >= 0) {
        out.number = number;
    }
    return out;
}

auto shift_postfix(std::string_view name, int increment) -> std::string {
    auto parsed = parse_postfix(name);
    if (!parsed.has_value() || !parsed->number.has_value()) {
        return std::string(name);
    }
    return fmt::format("{}{}{}", parsed->prefix, kPostfixSeparator, *parsed->number + increment);
}

auto postfix_range(const std::vector<std::string>& names) -> std::pair<int, int> {
    std::optional<int> lo;
    std::optional<int> hi;
    for (const auto& name : names) {
        auto parsed = parse_postfix(name);
        if (!parsed.has_value() || !parsed->number.has_value()) {
            continue;
        }
        int n = *parsed->number;
        lo = lo ? std::min(*lo, n) : n;
        hi = hi ? std::max(*hi, n) : n;
    }
    return {lo.value_or(-1), hi.value_or(-1)};
}

}  // namespace tabula
