#pragma once

#include <tabula/core/meta.hpp>
#include <tabula/core/value.hpp>
#include <tabula/expr/node.hpp>

#include <expected>
#include <map>
#include <string>
#include <vector>

namespace tabula::expr {

/// Values of one column as seen by an expression.
struct ColumnCtx {
    std::vector<Value> values;
    /// Values are known to be ascending (the table's primary index).
    bool sorted = false;
    Type type;
};

using TableCtx = std::map<std::string, ColumnCtx>;
using Context = std::map<TableRef, TableCtx>;

struct EvalResult {
    /// Either one broadcastable value or one value per row.
    std::vector<Value> values;
    bool sorted = false;
    Type type;
};

/// Evaluate an expression against column contexts.
///
/// Operands of length 1 broadcast against longer operands; any other length
/// disagreement is an error. Arithmetic with None yields None, ordered
/// comparisons with None are false, and None is falsy for and/or/not.
[[nodiscard]] auto evaluate(const Expr& expr, const Context& context)
    -> std::expected<EvalResult, std::string>;

}  // namespace tabula::expr
