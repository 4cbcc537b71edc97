#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tabula {

/// Separator between a column prefix and its postfix tag, e.g. "mz__0".
inline constexpr std::string_view kPostfixSeparator = "__";

/// Parsed "name__k" column name.
struct Postfix {
    std::string prefix;
    /// Full postfix including the separator, "" when the name carries none.
    std::string tag;
    /// Numeric value of the tag: -1 for no tag, k for "__k", nullopt for non-numeric tags.
    std::optional<int> number;
};

/// Parses a column name. Returns nullopt for internal names starting with "__".
/// Throws SchemaError for names with more than one separator.
[[nodiscard]] auto parse_postfix(std::string_view name) -> std::optional<Postfix>;

/// Name with its numeric postfix shifted by `increment`; untagged names count as -1.
[[nodiscard]] auto shift_postfix(std::string_view name, int increment) -> std::string;

/// Minimum and maximum numeric postfix over `names`; both -1 when there are none.
[[nodiscard]] auto postfix_range(const std::vector<std::string>& names) -> std::pair<int, int>;

}  // namespace tabula
