#pragma once

#include <tabula/core/value.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace tabula {

/// Display format of a column.
///
/// std::nullopt hides the column. Strings starting with '%' are printf style
/// ("%.2f", "%d", "%s", "%r" for repr); kMinutesFormat renders seconds as
/// minutes; anything else is a fmt replacement-field format such as "{:>6}".
using Format = std::optional<std::string>;

/// Renders a value in seconds as fractional minutes, e.g. "2.50m".
inline constexpr std::string_view kMinutesFormat = "@minutes";

using Formatter = std::function<std::string(const Value&)>;

/// Default format for a column type ("%d", "%.2f", "%s", else "%r").
[[nodiscard]] auto default_format(const Type& type) -> std::string;

/// Format guessed from column name and type: "m*" numeric columns get "%.5f",
/// "rt*" numeric columns get kMinutesFormat, else default_format.
[[nodiscard]] auto guess_format(std::string_view name, const Type& type) -> std::string;

/// None renders as "-"; a failing printf style format renders as "".
[[nodiscard]] auto format_value(const Value& value, const std::string& format) -> std::string;

/// Formatter closure for a column; hidden columns render as empty strings.
[[nodiscard]] auto make_formatter(const Format& format) -> Formatter;

}  // namespace tabula
