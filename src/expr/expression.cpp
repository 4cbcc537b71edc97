#include <tabula/core/error.hpp>
#include <tabula/expr/expression.hpp>
#include <tabula/table/table.hpp>

namespace tabula::expr {

namespace {

auto unary(UnaryOp op, const Expression& operand) -> Expression {
    return Expression(std::make_shared<const Expr>(Expr{UnaryExpr{op, operand.node()}}));
}

auto binary(BinaryOp op, const Expression& lhs, const Expression& rhs) -> Expression {
    return Expression(
        std::make_shared<const Expr>(Expr{BinaryExpr{op, lhs.node(), rhs.node()}}));
}

auto aggregate(AggFunc func, const Expression& operand) -> Expression {
    return Expression(std::make_shared<const Expr>(
        Expr{AggregateExpr{.func = func, .operand = operand.node(), .group_by = nullptr}}));
}

}  // namespace

auto Expression::is_none() const -> Expression { return unary(UnaryOp::IsNone, *this); }

auto Expression::is_not_none() const -> Expression { return unary(UnaryOp::IsNotNone, *this); }

auto Expression::is_in(std::vector<Value> values) const -> Expression {
    return Expression(
        std::make_shared<const Expr>(Expr{IsInExpr{.operand = node_, .values = std::move(values)}}));
}

auto Expression::apply(ApplyFn fn, bool filter_nones, std::optional<Type> type) const
    -> Expression {
    if (!fn) {
        throw ArgumentError("apply requires a callable");
    }
    return Expression(std::make_shared<const Expr>(Expr{ApplyExpr{.fn = std::move(fn),
                                                                  .operand = node_,
                                                                  .filter_nones = filter_nones,
                                                                  .type = std::move(type)}}));
}

auto Expression::count() const -> Expression { return aggregate(AggFunc::Count, *this); }
auto Expression::min() const -> Expression { return aggregate(AggFunc::Min, *this); }
auto Expression::max() const -> Expression { return aggregate(AggFunc::Max, *this); }
auto Expression::sum() const -> Expression { return aggregate(AggFunc::Sum, *this); }
auto Expression::mean() const -> Expression { return aggregate(AggFunc::Mean, *this); }
auto Expression::stddev() const -> Expression { return aggregate(AggFunc::Std, *this); }

auto Expression::group_by(const Expression& key) const -> Expression {
    const auto* agg = std::get_if<AggregateExpr>(&node_->node);
    if (agg == nullptr) {
        throw ArgumentError("group_by requires an aggregate expression, got " + to_string());
    }
    AggregateExpr grouped = *agg;
    grouped.group_by = key.node();
    return Expression(std::make_shared<const Expr>(Expr{std::move(grouped)}));
}

auto Expression::to_string() const -> std::string { return expr::to_string(*node_); }

ColumnHandle::ColumnHandle(const Table& table, std::string name, Type type)
    : Expression(make_column(table.ref(), name, std::move(type))),
      table_(&table),
      ref_(table.ref()),
      name_(std::move(name)) {}

auto ColumnHandle::values() const -> std::vector<Value> { return table_->column_values(name_); }

auto operator+(const Expression& lhs, const Expression& rhs) -> Expression {
    return binary(BinaryOp::Add, lhs, rhs);
}
auto operator-(const Expression& lhs, const Expression& rhs) -> Expression {
    return binary(BinaryOp::Sub, lhs, rhs);
}
auto operator*(const Expression& lhs, const Expression& rhs) -> Expression {
    return binary(BinaryOp::Mul, lhs, rhs);
}
auto operator/(const Expression& lhs, const Expression& rhs) -> Expression {
    return binary(BinaryOp::Div, lhs, rhs);
}
auto operator==(const Expression& lhs, const Expression& rhs) -> Expression {
    return binary(BinaryOp::Eq, lhs, rhs);
}
auto operator!=(const Expression& lhs, const Expression& rhs) -> Expression {
    return binary(BinaryOp::Ne, lhs, rhs);
}
auto operator<(const Expression& lhs, const Expression& rhs) -> Expression {
    return binary(BinaryOp::Lt, lhs, rhs);
}
auto operator<=(const Expression& lhs, const Expression& rhs) -> Expression {
    return binary(BinaryOp::Le, lhs, rhs);
}
auto operator>(const Expression& lhs, const Expression& rhs) -> Expression {
    return binary(BinaryOp::Gt, lhs, rhs);
}
auto operator>=(const Expression& lhs, const Expression& rhs) -> Expression {
    return binary(BinaryOp::Ge, lhs, rhs);
}
auto operator&(const Expression& lhs, const Expression& rhs) -> Expression {
    return binary(BinaryOp::And, lhs, rhs);
}
auto operator|(const Expression& lhs, const Expression& rhs) -> Expression {
    return binary(BinaryOp::Or, lhs, rhs);
}
auto operator!(const Expression& operand) -> Expression { return unary(UnaryOp::Not, operand); }
auto operator-(const Expression& operand) -> Expression { return unary(UnaryOp::Neg, operand); }

}  // namespace tabula::expr
