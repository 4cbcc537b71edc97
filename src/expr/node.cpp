#include <tabula/expr/node.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>

namespace tabula::expr {

namespace {

void collect_columns(const Expr& expr, std::vector<ColumnRef>& out) {
    std::visit(
        [&](const auto& node) {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, ColumnRef>) {
                bool seen = std::any_of(out.begin(), out.end(), [&](const ColumnRef& c) {
                    return c.table == node.table && c.name == node.name;
                });
                if (!seen) {
                    out.push_back(node);
                }
            } else if constexpr (std::is_same_v<T, UnaryExpr>) {
                collect_columns(*node.operand, out);
            } else if constexpr (std::is_same_v<T, BinaryExpr>) {
                collect_columns(*node.left, out);
                collect_columns(*node.right, out);
            } else if constexpr (std::is_same_v<T, AggregateExpr>) {
                collect_columns(*node.operand, out);
                if (node.group_by) {
                    collect_columns(*node.group_by, out);
                }
            } else if constexpr (std::is_same_v<T, ApplyExpr> || std::is_same_v<T, IsInExpr>) {
                collect_columns(*node.operand, out);
            }
        },
        expr.node);
}

auto agg_name(AggFunc func) -> std::string_view {
    switch (func) {
        case AggFunc::Count:
            return "count";
        case AggFunc::Min:
            return "min";
        case AggFunc::Max:
            return "max";
        case AggFunc::Sum:
            return "sum";
        case AggFunc::Mean:
            return "mean";
        case AggFunc::Std:
            return "std";
    }
    return "?";
}

}  // namespace

auto make_literal(Value value) -> ExprPtr {
    return std::make_shared<const Expr>(Expr{Literal{std::move(value)}});
}

auto make_column(TableRef table, std::string name, Type type) -> ExprPtr {
    return std::make_shared<const Expr>(
        Expr{ColumnRef{.table = table, .name = std::move(name), .type = std::move(type)}});
}

auto referenced_columns(const Expr& expr) -> std::vector<ColumnRef> {
    std::vector<ColumnRef> out;
    collect_columns(expr, out);
    return out;
}

auto referenced_tables(const Expr& expr) -> std::vector<TableRef> {
    std::vector<TableRef> out;
    for (const auto& column : referenced_columns(expr)) {
        if (std::find(out.begin(), out.end(), column.table) == out.end()) {
            out.push_back(column.table);
        }
    }
    return out;
}

auto to_string(BinaryOp op) -> std::string {
    switch (op) {
        case BinaryOp::Add:
            return "+";
        case BinaryOp::Sub:
            return "-";
        case BinaryOp::Mul:
            return "*";
        case BinaryOp::Div:
            return "/";
        case BinaryOp::Eq:
            return "==";
        case BinaryOp::Ne:
            return "!=";
        case BinaryOp::Lt:
            return "<";
        case BinaryOp::Le:
            return "<=";
        case BinaryOp::Gt:
            return ">";
        case BinaryOp::Ge:
            return ">=";
        case BinaryOp::And:
            return "&";
        case BinaryOp::Or:
            return "|";
    }
    return "?";
}

auto to_string(const Expr& expr) -> std::string {
    return std::visit(
        [](const auto& node) -> std::string {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, Literal>) {
                return node.value.repr();
            } else if constexpr (std::is_same_v<T, ColumnRef>) {
                return node.name;
            } else if constexpr (std::is_same_v<T, UnaryExpr>) {
                switch (node.op) {
                    case UnaryOp::Neg:
                        return fmt::format("-{}", to_string(*node.operand));
                    case UnaryOp::Not:
                        return fmt::format("!{}", to_string(*node.operand));
                    case UnaryOp::IsNone:
                        return fmt::format("{}.is_none()", to_string(*node.operand));
                    case UnaryOp::IsNotNone:
                        return fmt::format("{}.is_not_none()", to_string(*node.operand));
                }
                return "?";
            } else if constexpr (std::is_same_v<T, BinaryExpr>) {
                return fmt::format("({} {} {})", to_string(*node.left), to_string(node.op),
                                   to_string(*node.right));
            } else if constexpr (std::is_same_v<T, AggregateExpr>) {
                if (node.group_by) {
                    return fmt::format("{}.{}().group_by({})", to_string(*node.operand),
                                       agg_name(node.func), to_string(*node.group_by));
                }
                return fmt::format("{}.{}()", to_string(*node.operand), agg_name(node.func));
            } else if constexpr (std::is_same_v<T, ApplyExpr>) {
                return fmt::format("{}.apply(...)", to_string(*node.operand));
            } else {
                std::vector<std::string> items;
                items.reserve(node.values.size());
                for (const auto& v : node.values) {
                    items.push_back(v.repr());
                }
                return fmt::format("{}.is_in([{}])", to_string(*node.operand),
                                   fmt::join(items, ", "));
            }
        },
        expr.node);
}

}  // namespace tabula::expr
