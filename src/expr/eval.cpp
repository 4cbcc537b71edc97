#include <tabula/expr/eval.hpp>

#include <fmt/format.h>
#include <robin_hood.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <exception>

namespace tabula::expr {

namespace {

using Result = std::expected<EvalResult, std::string>;

auto broadcast_size(std::size_t lhs, std::size_t rhs) -> std::optional<std::size_t> {
    if (lhs == rhs) {
        return lhs;
    }
    if (lhs == 1) {
        return rhs;
    }
    if (rhs == 1) {
        return lhs;
    }
    return std::nullopt;
}

auto at(const std::vector<Value>& values, std::size_t i) -> const Value& {
    return values.size() == 1 ? values[0] : values[i];
}

auto is_comparison(BinaryOp op) -> bool {
    switch (op) {
        case BinaryOp::Eq:
        case BinaryOp::Ne:
        case BinaryOp::Lt:
        case BinaryOp::Le:
        case BinaryOp::Gt:
        case BinaryOp::Ge:
            return true;
        default:
            return false;
    }
}

auto flip_cmp(BinaryOp op) -> BinaryOp {
    switch (op) {
        case BinaryOp::Lt:
            return BinaryOp::Gt;
        case BinaryOp::Le:
            return BinaryOp::Ge;
        case BinaryOp::Gt:
            return BinaryOp::Lt;
        case BinaryOp::Ge:
            return BinaryOp::Le;
        default:
            return op;
    }
}

auto arith_type(BinaryOp op, const Type& lhs, const Type& rhs) -> Type {
    if (op == BinaryOp::Div) {
        return Type::floating();
    }
    if (lhs.is_numeric() && rhs.is_numeric()) {
        if (lhs.kind == TypeKind::Float || rhs.kind == TypeKind::Float) {
            return Type::floating();
        }
        return Type::integer();
    }
    if (op == BinaryOp::Add && lhs.kind == TypeKind::Str && rhs.kind == TypeKind::Str) {
        return Type::string();
    }
    return Type::any();
}

auto arith(BinaryOp op, const Value& lhs, const Value& rhs) -> std::expected<Value, std::string> {
    if (lhs.is_none() || rhs.is_none()) {
        return Value{};
    }
    if (op == BinaryOp::Add && lhs.is_string() && rhs.is_string()) {
        return Value(lhs.as_string() + rhs.as_string());
    }
    if (!lhs.is_number() || !rhs.is_number()) {
        return std::unexpected(fmt::format("unsupported operand types for {}: {} and {}",
                                           to_string(op), to_string(type_of(lhs)),
                                           to_string(type_of(rhs))));
    }
    bool both_int = !lhs.is_float() && !rhs.is_float();
    if (both_int && op != BinaryOp::Div) {
        std::int64_t out = 0;
        bool overflow = false;
        switch (op) {
            case BinaryOp::Add:
                overflow = __builtin_add_overflow(lhs.as_int(), rhs.as_int(), &out);
                break;
            case BinaryOp::Sub:
                overflow = __builtin_sub_overflow(lhs.as_int(), rhs.as_int(), &out);
                break;
            case BinaryOp::Mul:
                overflow = __builtin_mul_overflow(lhs.as_int(), rhs.as_int(), &out);
                break;
            default:
                return std::unexpected("not an arithmetic operator: " + to_string(op));
        }
        if (overflow) {
            return std::unexpected(fmt::format("integer overflow in {} {} {}", lhs.repr(),
                                               to_string(op), rhs.repr()));
        }
        return Value(out);
    }
    switch (op) {
        case BinaryOp::Add:
            return Value(lhs.as_float() + rhs.as_float());
        case BinaryOp::Sub:
            return Value(lhs.as_float() - rhs.as_float());
        case BinaryOp::Mul:
            return Value(lhs.as_float() * rhs.as_float());
        case BinaryOp::Div:
            return Value(lhs.as_float() / rhs.as_float());
        default:
            return std::unexpected("not an arithmetic operator: " + to_string(op));
    }
}

auto compare(BinaryOp op, const Value& lhs, const Value& rhs) -> bool {
    switch (op) {
        case BinaryOp::Eq:
            return lhs == rhs;
        case BinaryOp::Ne:
            return !(lhs == rhs);
        default:
            break;
    }
    if (lhs.is_none() || rhs.is_none()) {
        return false;
    }
    int c = compare_values(lhs, rhs);
    switch (op) {
        case BinaryOp::Lt:
            return c < 0;
        case BinaryOp::Le:
            return c <= 0;
        case BinaryOp::Gt:
            return c > 0;
        case BinaryOp::Ge:
            return c >= 0;
        default:
            return false;
    }
}

// Comparison of an ascending column against a scalar via binary search.
auto compare_sorted(BinaryOp op, const std::vector<Value>& column, const Value& scalar)
    -> std::vector<Value> {
    auto first = std::partition_point(column.begin(), column.end(),
                                      [](const Value& v) { return v.is_none(); });
    auto lower = std::partition_point(
        first, column.end(), [&](const Value& v) { return compare_values(v, scalar) < 0; });
    auto upper = std::partition_point(
        lower, column.end(), [&](const Value& v) { return compare_values(v, scalar) <= 0; });

    auto begin = column.begin();
    auto end = column.end();
    switch (op) {
        case BinaryOp::Lt:
            end = lower;
            begin = first;
            break;
        case BinaryOp::Le:
            end = upper;
            begin = first;
            break;
        case BinaryOp::Gt:
            begin = upper;
            break;
        case BinaryOp::Ge:
            begin = lower;
            break;
        default:
            begin = lower;
            end = upper;
            break;
    }
    std::vector<Value> out(column.size(), Value(false));
    auto from = static_cast<std::size_t>(begin - column.begin());
    auto to = static_cast<std::size_t>(end - column.begin());
    for (std::size_t i = from; i < to; ++i) {
        out[i] = Value(true);
    }
    return out;
}

auto can_use_sorted(BinaryOp op, const EvalResult& column, const EvalResult& scalar) -> bool {
    if (!column.sorted || column.values.size() <= 1 || scalar.values.size() != 1) {
        return false;
    }
    const auto& s = scalar.values[0];
    if (s.is_none() || s.is_object()) {
        return false;
    }
    switch (op) {
        case BinaryOp::Eq:
        case BinaryOp::Lt:
        case BinaryOp::Le:
        case BinaryOp::Gt:
        case BinaryOp::Ge:
            return true;
        default:
            return false;
    }
}

auto is_numeric_shift(const EvalResult& column, const EvalResult& scalar) -> bool {
    return column.type.is_numeric() && scalar.values.size() == 1 && scalar.values[0].is_number();
}

auto aggregate_values(AggFunc func, const std::vector<const Value*>& values)
    -> std::expected<Value, std::string> {
    std::vector<const Value*> present;
    present.reserve(values.size());
    for (const auto* v : values) {
        if (!v->is_none()) {
            present.push_back(v);
        }
    }
    if (func == AggFunc::Count) {
        return Value(static_cast<std::int64_t>(present.size()));
    }
    if (present.empty()) {
        return Value{};
    }
    if (func == AggFunc::Min || func == AggFunc::Max) {
        const Value* best = present.front();
        for (const auto* v : present) {
            int c = compare_values(*v, *best);
            if ((func == AggFunc::Min && c < 0) || (func == AggFunc::Max && c > 0)) {
                best = v;
            }
        }
        return *best;
    }
    bool all_int = true;
    for (const auto* v : present) {
        if (!v->is_number()) {
            return std::unexpected(
                fmt::format("can not aggregate non-numeric value {}", v->repr()));
        }
        all_int = all_int && !v->is_float();
    }
    if (func == AggFunc::Sum && all_int) {
        std::int64_t total = 0;
        for (const auto* v : present) {
            if (__builtin_add_overflow(total, v->as_int(), &total)) {
                return std::unexpected("integer overflow in sum");
            }
        }
        return Value(total);
    }
    double sum = 0.0;
    for (const auto* v : present) {
        sum += v->as_float();
    }
    if (func == AggFunc::Sum) {
        return Value(sum);
    }
    double mean = sum / static_cast<double>(present.size());
    if (func == AggFunc::Mean) {
        return Value(mean);
    }
    double sq = 0.0;
    for (const auto* v : present) {
        double d = v->as_float() - mean;
        sq += d * d;
    }
    return Value(std::sqrt(sq / static_cast<double>(present.size())));
}

auto aggregate_type(AggFunc func, const Type& operand) -> Type {
    switch (func) {
        case AggFunc::Count:
            return Type::integer();
        case AggFunc::Mean:
        case AggFunc::Std:
            return Type::floating();
        case AggFunc::Sum:
            return operand.kind == TypeKind::Float ? Type::floating()
                                                   : (operand.is_numeric() ? Type::integer()
                                                                           : Type::any());
        default:
            return operand;
    }
}

auto eval_node(const Expr& expr, const Context& context) -> Result;

auto eval_column(const ColumnRef& ref, const Context& context) -> Result {
    auto table = context.find(ref.table);
    if (table == context.end()) {
        return std::unexpected(
            fmt::format("column {} belongs to a table which is not part of this operation",
                        ref.name));
    }
    auto column = table->second.find(ref.name);
    if (column == table->second.end()) {
        return std::unexpected(fmt::format("column {} not found", ref.name));
    }
    return EvalResult{.values = column->second.values,
                      .sorted = column->second.sorted,
                      .type = column->second.type};
}

auto eval_unary(const UnaryExpr& node, const Context& context) -> Result {
    auto operand = eval_node(*node.operand, context);
    if (!operand) {
        return operand;
    }
    EvalResult out;
    out.values.reserve(operand->values.size());
    switch (node.op) {
        case UnaryOp::Neg:
            for (const auto& v : operand->values) {
                if (v.is_none()) {
                    out.values.emplace_back();
                } else if (v.is_float()) {
                    out.values.emplace_back(-v.as_float());
                } else if (v.is_number()) {
                    std::int64_t negated = 0;
                    if (__builtin_sub_overflow(std::int64_t{0}, v.as_int(), &negated)) {
                        return std::unexpected(fmt::format("integer overflow in -{}", v.repr()));
                    }
                    out.values.emplace_back(negated);
                } else {
                    return std::unexpected(fmt::format("can not negate {}", v.repr()));
                }
            }
            out.type = operand->type.kind == TypeKind::Float ? Type::floating()
                                                             : (operand->type.is_numeric()
                                                                    ? Type::integer()
                                                                    : operand->type);
            return out;
        case UnaryOp::Not:
            for (const auto& v : operand->values) {
                out.values.emplace_back(!v.truthy());
            }
            break;
        case UnaryOp::IsNone:
            for (const auto& v : operand->values) {
                out.values.emplace_back(v.is_none());
            }
            break;
        case UnaryOp::IsNotNone:
            for (const auto& v : operand->values) {
                out.values.emplace_back(!v.is_none());
            }
            break;
    }
    out.type = Type::boolean();
    return out;
}

auto eval_binary(const BinaryExpr& node, const Context& context) -> Result {
    auto lhs = eval_node(*node.left, context);
    if (!lhs) {
        return lhs;
    }
    auto rhs = eval_node(*node.right, context);
    if (!rhs) {
        return rhs;
    }
    auto n = broadcast_size(lhs->values.size(), rhs->values.size());
    if (!n) {
        return std::unexpected(fmt::format("operand lengths {} and {} do not match in {}",
                                           lhs->values.size(), rhs->values.size(),
                                           to_string(Expr{node})));
    }

    if (is_comparison(node.op)) {
        if (can_use_sorted(node.op, *lhs, *rhs)) {
            return EvalResult{.values = compare_sorted(node.op, lhs->values, rhs->values[0]),
                              .sorted = false,
                              .type = Type::boolean()};
        }
        if (can_use_sorted(flip_cmp(node.op), *rhs, *lhs)) {
            return EvalResult{
                .values = compare_sorted(flip_cmp(node.op), rhs->values, lhs->values[0]),
                .sorted = false,
                .type = Type::boolean()};
        }
    }

    EvalResult out;
    out.values.reserve(*n);
    for (std::size_t i = 0; i < *n; ++i) {
        const auto& a = at(lhs->values, i);
        const auto& b = at(rhs->values, i);
        switch (node.op) {
            case BinaryOp::And:
                out.values.emplace_back(a.truthy() && b.truthy());
                break;
            case BinaryOp::Or:
                out.values.emplace_back(a.truthy() || b.truthy());
                break;
            case BinaryOp::Add:
            case BinaryOp::Sub:
            case BinaryOp::Mul:
            case BinaryOp::Div: {
                auto v = arith(node.op, a, b);
                if (!v) {
                    return std::unexpected(v.error());
                }
                out.values.push_back(std::move(*v));
                break;
            }
            default:
                out.values.emplace_back(compare(node.op, a, b));
                break;
        }
    }
    if (node.op == BinaryOp::Add || node.op == BinaryOp::Sub || node.op == BinaryOp::Mul ||
        node.op == BinaryOp::Div) {
        out.type = arith_type(node.op, lhs->type, rhs->type);
        // shifting a numeric column by a numeric constant keeps the order
        out.sorted = (node.op == BinaryOp::Add || node.op == BinaryOp::Sub) &&
                     ((lhs->sorted && is_numeric_shift(*lhs, *rhs)) ||
                      (node.op == BinaryOp::Add && rhs->sorted && is_numeric_shift(*rhs, *lhs)));
    } else {
        out.type = Type::boolean();
    }
    return out;
}

auto eval_aggregate(const AggregateExpr& node, const Context& context) -> Result {
    auto operand = eval_node(*node.operand, context);
    if (!operand) {
        return operand;
    }
    Type type = aggregate_type(node.func, operand->type);
    if (!node.group_by) {
        std::vector<const Value*> all;
        all.reserve(operand->values.size());
        for (const auto& v : operand->values) {
            all.push_back(&v);
        }
        auto v = aggregate_values(node.func, all);
        if (!v) {
            return std::unexpected(v.error());
        }
        return EvalResult{.values = {std::move(*v)}, .sorted = false, .type = type};
    }

    auto keys = eval_node(*node.group_by, context);
    if (!keys) {
        return keys;
    }
    auto n = broadcast_size(operand->values.size(), keys->values.size());
    if (!n) {
        return std::unexpected(fmt::format("group_by key length {} does not match values length {}",
                                           keys->values.size(), operand->values.size()));
    }
    robin_hood::unordered_flat_map<Value, std::vector<std::size_t>, ValueHash> groups;
    std::vector<Value> order;
    for (std::size_t i = 0; i < *n; ++i) {
        const auto& key = at(keys->values, i);
        auto [it, inserted] = groups.try_emplace(key);
        if (inserted) {
            order.push_back(key);
        }
        it->second.push_back(i);
    }
    EvalResult out{.values = std::vector<Value>(*n), .sorted = false, .type = type};
    for (const auto& key : order) {
        const auto& rows = groups.at(key);
        std::vector<const Value*> members;
        members.reserve(rows.size());
        for (auto row : rows) {
            members.push_back(&at(operand->values, row));
        }
        auto v = aggregate_values(node.func, members);
        if (!v) {
            return std::unexpected(v.error());
        }
        for (auto row : rows) {
            out.values[row] = *v;
        }
    }
    return out;
}

auto eval_apply(const ApplyExpr& node, const Context& context) -> Result {
    auto operand = eval_node(*node.operand, context);
    if (!operand) {
        return operand;
    }
    EvalResult out;
    out.values.reserve(operand->values.size());
    for (const auto& v : operand->values) {
        if (node.filter_nones && v.is_none()) {
            out.values.emplace_back();
            continue;
        }
        try {
            out.values.push_back(node.fn(v));
        } catch (const std::exception& e) {
            return std::unexpected(fmt::format("apply failed for {}: {}", v.repr(), e.what()));
        }
    }
    out.type = node.type.value_or(common_type_for(out.values));
    return out;
}

auto eval_is_in(const IsInExpr& node, const Context& context) -> Result {
    auto operand = eval_node(*node.operand, context);
    if (!operand) {
        return operand;
    }
    EvalResult out{.values = {}, .sorted = false, .type = Type::boolean()};
    out.values.reserve(operand->values.size());
    for (const auto& v : operand->values) {
        bool found = std::any_of(node.values.begin(), node.values.end(),
                                 [&](const Value& candidate) { return candidate == v; });
        out.values.emplace_back(found);
    }
    return out;
}

auto eval_node(const Expr& expr, const Context& context) -> Result {
    return std::visit(
        [&](const auto& node) -> Result {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, Literal>) {
                return EvalResult{.values = {node.value}, .sorted = false,
                                  .type = type_of(node.value)};
            } else if constexpr (std::is_same_v<T, ColumnRef>) {
                return eval_column(node, context);
            } else if constexpr (std::is_same_v<T, UnaryExpr>) {
                return eval_unary(node, context);
            } else if constexpr (std::is_same_v<T, BinaryExpr>) {
                return eval_binary(node, context);
            } else if constexpr (std::is_same_v<T, AggregateExpr>) {
                return eval_aggregate(node, context);
            } else if constexpr (std::is_same_v<T, ApplyExpr>) {
                return eval_apply(node, context);
            } else {
                return eval_is_in(node, context);
            }
        },
        expr.node);
}

}  // namespace

auto evaluate(const Expr& expr, const Context& context) -> std::expected<EvalResult, std::string> {
    return eval_node(expr, context);
}

}  // namespace tabula::expr
