#pragma once

#include <tabula/expr/node.hpp>

#include <concepts>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace tabula {
class Table;
}

namespace tabula::expr {

/// Value-semantic handle used to build expression trees with C++ operators.
///
///     auto mz = table.column("mz");
///     auto hits = table.filter(mz >= 100.0 & mz.is_not_none());
class Expression {
   public:
    explicit Expression(ExprPtr node) : node_(std::move(node)) {}

    /// Literal expression from anything a Value can hold.
    template <typename T>
        requires(!std::derived_from<std::decay_t<T>, Expression> &&
                 std::constructible_from<Value, T>)
    Expression(T&& value) : node_(make_literal(Value(std::forward<T>(value)))) {}

    [[nodiscard]] auto node() const noexcept -> const ExprPtr& { return node_; }

    [[nodiscard]] auto is_none() const -> Expression;
    [[nodiscard]] auto is_not_none() const -> Expression;
    [[nodiscard]] auto is_in(std::vector<Value> values) const -> Expression;

    /// Element-wise function; by default None values bypass `fn`.
    [[nodiscard]] auto apply(ApplyFn fn, bool filter_nones = true,
                             std::optional<Type> type = std::nullopt) const -> Expression;

    [[nodiscard]] auto count() const -> Expression;
    [[nodiscard]] auto min() const -> Expression;
    [[nodiscard]] auto max() const -> Expression;
    [[nodiscard]] auto sum() const -> Expression;
    [[nodiscard]] auto mean() const -> Expression;
    [[nodiscard]] auto stddev() const -> Expression;

    /// Aggregate per group of `key`, broadcast back to every row.
    /// Throws ArgumentError unless this is an aggregate.
    [[nodiscard]] auto group_by(const Expression& key) const -> Expression;

    [[nodiscard]] auto to_string() const -> std::string;

   private:
    ExprPtr node_;
};

/// Expression bound to a column of a table, with direct access to its values.
/// The handle must not outlive the table.
class ColumnHandle : public Expression {
   public:
    ColumnHandle(const Table& table, std::string name, Type type);

    [[nodiscard]] auto name() const noexcept -> const std::string& { return name_; }
    [[nodiscard]] auto table_ref() const noexcept -> TableRef { return ref_; }
    /// Current cell values of the column.
    [[nodiscard]] auto values() const -> std::vector<Value>;

   private:
    const Table* table_;
    TableRef ref_;
    std::string name_;
};

[[nodiscard]] auto operator+(const Expression& lhs, const Expression& rhs) -> Expression;
[[nodiscard]] auto operator-(const Expression& lhs, const Expression& rhs) -> Expression;
[[nodiscard]] auto operator*(const Expression& lhs, const Expression& rhs) -> Expression;
[[nodiscard]] auto operator/(const Expression& lhs, const Expression& rhs) -> Expression;
[[nodiscard]] auto operator==(const Expression& lhs, const Expression& rhs) -> Expression;
[[nodiscard]] auto operator!=(const Expression& lhs, const Expression& rhs) -> Expression;
[[nodiscard]] auto operator<(const Expression& lhs, const Expression& rhs) -> Expression;
[[nodiscard]] auto operator<=(const Expression& lhs, const Expression& rhs) -> Expression;
[[nodiscard]] auto operator>(const Expression& lhs, const Expression& rhs) -> Expression;
[[nodiscard]] auto operator>=(const Expression& lhs, const Expression& rhs) -> Expression;
[[nodiscard]] auto operator&(const Expression& lhs, const Expression& rhs) -> Expression;
[[nodiscard]] auto operator|(const Expression& lhs, const Expression& rhs) -> Expression;
[[nodiscard]] auto operator!(const Expression& operand) -> Expression;
[[nodiscard]] auto operator-(const Expression& operand) -> Expression;

}  // namespace tabula::expr
