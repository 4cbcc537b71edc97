#pragma once

#include <tabula/core/meta.hpp>
#include <tabula/core/value.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tabula::expr {

/// Expression tree node; immutable once built, so subtrees are shared.
struct Expr;
using ExprPtr = std::shared_ptr<const Expr>;

/// Constant value, evaluates to a length-1 result.
struct Literal {
    Value value;
};

/// Column of a specific table instance.
struct ColumnRef {
    TableRef table;
    std::string name;
    Type type;
};

enum class UnaryOp : std::uint8_t {
    Neg,
    Not,
    IsNone,
    IsNotNone,
};

enum class BinaryOp : std::uint8_t {
    Add,
    Sub,
    Mul,
    Div,
    Eq,
    Ne,
    Lt,
    Le,
    Gt,
    Ge,
    And,
    Or,
};

/// Supported aggregation functions; None values are skipped.
enum class AggFunc : std::uint8_t {
    Count,
    Min,
    Max,
    Sum,
    Mean,
    Std,
};

struct UnaryExpr {
    UnaryOp op = UnaryOp::Not;
    ExprPtr operand;
};

struct BinaryExpr {
    BinaryOp op = BinaryOp::Add;
    ExprPtr left;
    ExprPtr right;
};

/// Aggregate over the operand. Without `group_by` the result is a single value;
/// with it, every row receives the aggregate of its group.
struct AggregateExpr {
    AggFunc func = AggFunc::Count;
    ExprPtr operand;
    ExprPtr group_by;
};

using ApplyFn = std::function<Value(const Value&)>;

/// Element-wise user function.
struct ApplyExpr {
    ApplyFn fn;
    ExprPtr operand;
    /// Pass None through without calling `fn`.
    bool filter_nones = true;
    std::optional<Type> type;
};

/// Membership test against a fixed set of values.
struct IsInExpr {
    ExprPtr operand;
    std::vector<Value> values;
};

struct Expr {
    std::variant<Literal, ColumnRef, UnaryExpr, BinaryExpr, AggregateExpr, ApplyExpr, IsInExpr>
        node;
};

[[nodiscard]] auto make_literal(Value value) -> ExprPtr;
[[nodiscard]] auto make_column(TableRef table, std::string name, Type type) -> ExprPtr;

/// Distinct column references in first-seen order.
[[nodiscard]] auto referenced_columns(const Expr& expr) -> std::vector<ColumnRef>;

/// Distinct table identities referenced by the expression.
[[nodiscard]] auto referenced_tables(const Expr& expr) -> std::vector<TableRef>;

/// Infix rendering for diagnostics, e.g. "(mz >= 100.0)".
[[nodiscard]] auto to_string(const Expr& expr) -> std::string;

[[nodiscard]] auto to_string(BinaryOp op) -> std::string;

}  // namespace tabula::expr
