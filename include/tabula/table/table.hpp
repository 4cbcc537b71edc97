#pragma once

#include <tabula/core/format.hpp>
#include <tabula/core/meta.hpp>
#include <tabula/core/value.hpp>
#include <tabula/expr/eval.hpp>
#include <tabula/expr/expression.hpp>
#include <tabula/table/columns.hpp>

#include <concepts>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace tabula {

class Table;

/// Column position given by column name or index (negative counts from the end).
using ColumnPosition = std::variant<std::string, int>;

/// Type, format and placement of a new column.
struct ColumnSpec {
    /// Inferred from the values when not given.
    std::optional<Type> type;
    /// "" guesses a format from name and type; std::nullopt hides the column.
    Format format = std::string();
    std::optional<ColumnPosition> insert_before;
    std::optional<ColumnPosition> insert_after;
};

/// Computes the value of a new column for one row; receives the column name.
using RowFunction = std::function<Value(const Table&, const Row&, std::string_view)>;

struct StoreOptions {
    bool force_overwrite = false;
    /// Share content-identical object cells before writing.
    bool compressed = true;
};

/// Anything convertible to a single cell value (but not an expression).
template <typename T>
concept ValueLike = std::constructible_from<Value, T> &&
                    !std::derived_from<std::decay_t<T>, expr::Expression> &&
                    !std::same_as<std::decay_t<T>, std::vector<Value>>;

/// In-memory, column-typed, row-oriented table.
///
/// Rows are vectors of Values, one per column. Query operations (filter, join,
/// split_by, ...) return new tables; column algebra (add_column, drop_columns,
/// rename_columns, ...) works in place. A Table is itself a cell object, so
/// tables nest.
class Table final : public Object {
   public:
    /// Column names must not contain "__"; formats equal to "" hide the column.
    Table(std::vector<std::string> names, std::vector<Type> types, std::vector<Format> formats,
          std::vector<Row> rows = {}, std::optional<std::string> title = std::nullopt,
          Meta meta = {});

    /// Like the constructor, but accepts postfixed names such as "mz__0".
    [[nodiscard]] static auto create(std::vector<std::string> names, std::vector<Type> types,
                                     std::vector<Format> formats, std::vector<Row> rows = {},
                                     std::optional<std::string> title = std::nullopt,
                                     Meta meta = {}) -> Table;

    /// Copies get a new identity.
    Table(const Table& other);
    auto operator=(const Table& other) -> Table&;
    Table(Table&&) noexcept = default;
    auto operator=(Table&&) noexcept -> Table& = default;
    ~Table() override = default;

    // Object interface.
    [[nodiscard]] auto type_name() const -> std::string override { return "Table"; }
    [[nodiscard]] auto unique_id() const -> std::string override;
    [[nodiscard]] auto clone() const -> ObjectPtr override;
    [[nodiscard]] auto equals(const Object& other) const -> bool override;
    [[nodiscard]] auto hash() const -> std::size_t override;
    [[nodiscard]] auto to_string() const -> std::string override;
    [[nodiscard]] auto encode() const -> std::string override;
    /// Inverse of encode(); throws LoadError.
    [[nodiscard]] static auto decode(std::string_view payload) -> std::shared_ptr<const Table>;

    [[nodiscard]] auto ref() const noexcept -> TableRef { return ref_; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return rows_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return rows_.empty(); }
    [[nodiscard]] auto num_columns() const noexcept -> std::size_t { return columns_.size(); }

    [[nodiscard]] auto columns() const noexcept -> const ColumnRegistry& { return columns_; }
    [[nodiscard]] auto column_names() const -> const std::vector<std::string>& { return columns_.names(); }
    [[nodiscard]] auto column_types() const -> const std::vector<Type>& { return columns_.types(); }
    [[nodiscard]] auto column_formats() const -> const std::vector<Format>& { return columns_.formats(); }
    /// Names of columns with a format.
    [[nodiscard]] auto visible_column_names() const -> std::vector<std::string>;
    [[nodiscard]] auto has_column(std::string_view name) const -> bool { return columns_.has_column(name); }
    [[nodiscard]] auto col_index(std::string_view name) const -> std::size_t { return columns_.index_of(name); }
    [[nodiscard]] auto col_type(std::string_view name) const -> const Type&;
    [[nodiscard]] auto col_format(std::string_view name) const -> const Format&;
    void ensure_columns(const std::vector<std::string>& names) const { columns_.ensure_columns(names); }

    [[nodiscard]] auto rows() const noexcept -> const std::vector<Row>& { return rows_; }
    [[nodiscard]] auto row(std::size_t index) const -> const Row&;

    [[nodiscard]] auto title() const noexcept -> const std::optional<std::string>& { return title_; }
    void set_title(std::optional<std::string> title) { title_ = std::move(title); }

    [[nodiscard]] auto meta() const noexcept -> const Meta& { return meta_; }
    /// Sets a meta entry; invalidates the cached unique id.
    void set_meta(MetaKey key, MetaValue value);

    /// Column the rows are known to be ascending-sorted by.
    [[nodiscard]] auto primary_index() const noexcept -> const std::optional<std::string>& { return primary_index_; }

    /// Version string found in the header of the loaded file.
    [[nodiscard]] auto version() const noexcept -> const std::optional<std::string>& { return version_; }

    // Cell access.
    [[nodiscard]] auto column(const std::string& name) const -> expr::ColumnHandle;
    [[nodiscard]] auto column_values(std::string_view name) const -> std::vector<Value>;
    /// Value of `name` in row `row_index`, or `fallback` if there is no such column.
    [[nodiscard]] auto get_value(std::size_t row_index, std::string_view name,
                                 const Value& fallback = {}) const -> Value;
    [[nodiscard]] auto get_values(std::size_t row_index) const -> std::map<std::string, Value>;

    void set_value(std::size_t row_index, std::string_view name, const Value& value);
    /// Replaces row `row_index`; values are coerced to int, float and str column types.
    void set_row(std::size_t row_index, Row row);
    /// Appends a row; rolled back when validation fails.
    void add_row(Row row);

    void set_col_type(std::string_view name, Type type);
    void set_col_format(std::string_view name, Format format);

    // Column algebra.
    /// Adds a column computed from an expression, a RowFunction, a vector of
    /// values or a constant.
    template <typename Source>
    void add_column(const std::string& name, Source&& source, ColumnSpec spec = {}) {
        check_new_name(name);
        insert_column(name, materialize(name, std::forward<Source>(source)), std::move(spec));
    }
    void add_column(const std::string& name, std::vector<Value> values, ColumnSpec spec = {}) {
        check_new_name(name);
        insert_column(name, materialize(name, std::move(values)), std::move(spec));
    }
    /// Adds a column holding `value` in every row, without coercion.
    void add_constant_column(const std::string& name, Value value, ColumnSpec spec = {});

    /// Replaces an existing column in place, keeping its position.
    template <typename Source>
    void replace_column(const std::string& name, Source&& source, ColumnSpec spec = {}) {
        replace_values(name, materialize(name, std::forward<Source>(source)), std::move(spec));
    }
    void replace_column(const std::string& name, std::vector<Value> values, ColumnSpec spec = {}) {
        replace_values(name, materialize(name, std::move(values)), std::move(spec));
    }

    /// replace_column if `name` exists, else add_column.
    template <typename Source>
    void update_column(const std::string& name, Source&& source, ColumnSpec spec = {}) {
        if (has_column(name)) {
            replace_column(name, std::forward<Source>(source), std::move(spec));
        } else {
            add_column(name, std::forward<Source>(source), std::move(spec));
        }
    }
    void update_column(const std::string& name, std::vector<Value> values, ColumnSpec spec = {}) {
        if (has_column(name)) {
            replace_column(name, std::move(values), std::move(spec));
        } else {
            add_column(name, std::move(values), std::move(spec));
        }
    }

    /// Inserts an int column 0..n-1 as first column.
    void add_enumeration(const std::string& name = "id");
    void drop_columns(const std::vector<std::string>& names);
    void rename_columns(const std::map<std::string, std::string>& mapping);
    /// New table with the given columns in the given order.
    [[nodiscard]] auto extract_columns(const std::vector<std::string>& names) const -> Table;

    // Postfixes.
    /// Strips the given postfixes, or every "__*" postfix when empty.
    void remove_postfixes(const std::vector<std::string>& postfixes = {});
    /// Renames postfixes, e.g. {"__0": "_left"}.
    void rename_postfixes(const std::map<std::string, std::string>& mapping);
    /// Postfixes shared by all of the given column name prefixes.
    [[nodiscard]] auto supported_postfixes(const std::vector<std::string>& prefixes) const
        -> std::vector<std::string>;
    [[nodiscard]] auto find_postfixes() const -> std::set<std::string>;
    [[nodiscard]] auto min_postfix() const -> int;
    [[nodiscard]] auto max_postfix() const -> int;

    // Queries.
    [[nodiscard]] auto filter(const expr::Expression& condition) const -> Table;
    [[nodiscard]] auto filter(bool keep) const -> Table;

    /// Cross product of rows for which `condition` holds; right columns get
    /// their postfixes shifted past the left ones.
    [[nodiscard]] auto join(const Table& other, const expr::Expression& condition = true,
                            std::optional<std::string> title = std::nullopt) const -> Table;
    [[nodiscard]] auto join(const Object& other, const expr::Expression& condition = true,
                            std::optional<std::string> title = std::nullopt) const -> Table;
    /// Like join, but left rows without partner appear once with None right values.
    [[nodiscard]] auto left_join(const Table& other, const expr::Expression& condition = true,
                                 std::optional<std::string> title = std::nullopt) const -> Table;
    [[nodiscard]] auto left_join(const Object& other, const expr::Expression& condition = true,
                                 std::optional<std::string> title = std::nullopt) const -> Table;

    /// Stable in-place sort; returns the permutation applied.
    auto sort_by(const std::vector<std::string>& names, bool ascending = true)
        -> std::vector<std::size_t>;
    [[nodiscard]] auto split_by(const std::vector<std::string>& names) const -> std::vector<Table>;
    [[nodiscard]] auto unique_rows() const -> Table;
    /// One row per group of `names` plus a "collapsed" column holding the group.
    [[nodiscard]] auto collapse(const std::vector<std::string>& names) const -> Table;

    /// Appends rows of tables with identical names and types.
    void append(const Table& other);
    void append(const std::vector<Table>& others);

    [[nodiscard]] auto copy() const -> Table { return Table(*this); }
    /// Rows [begin, end) as a new table.
    [[nodiscard]] auto slice(std::size_t begin, std::size_t end) const -> Table;
    [[nodiscard]] auto row_table(std::size_t index) const -> Table;

    /// Replaces content-identical object cells by one shared instance.
    void compress_objects();

    void store(const std::filesystem::path& path, const StoreOptions& options = {});
    [[nodiscard]] static auto load(const std::filesystem::path& path) -> Table;

    /// Per column summary: distinct values, Nones, type and format.
    [[nodiscard]] auto info() const -> std::string;

    /// Formatter of column `index`.
    [[nodiscard]] auto formatter(std::size_t index) const -> const Formatter& { return formatters_.at(index); }

    /// Rebuilds formatters and drops the cached unique id.
    void reset_internals();

   private:
    struct Materialized {
        std::vector<Value> values;
        Type type;
        bool constant = false;
    };

    struct Unchecked {};
    Table(Unchecked, ColumnRegistry columns, std::vector<Row> rows, std::optional<std::string> title,
          Meta meta);

    [[nodiscard]] auto materialize(const std::string& name, const expr::Expression& expression) const
        -> Materialized;
    [[nodiscard]] auto materialize(const std::string& name, const RowFunction& fn) const
        -> Materialized;
    [[nodiscard]] auto materialize(const std::string& name, std::vector<Value> values) const
        -> Materialized;
    template <ValueLike T>
    [[nodiscard]] auto materialize(const std::string& /*name*/, T&& value) const -> Materialized {
        return materialize_constant(Value(std::forward<T>(value)));
    }
    [[nodiscard]] auto materialize_constant(Value value) const -> Materialized;

    void check_new_name(const std::string& name) const;
    void insert_column(const std::string& name, Materialized column, ColumnSpec spec);
    void replace_values(const std::string& name, Materialized column, ColumnSpec spec);
    [[nodiscard]] auto resolve_position(const ColumnSpec& spec) const -> std::size_t;

    [[nodiscard]] auto context_for(const std::vector<std::string>& names) const -> expr::TableCtx;
    [[nodiscard]] auto join_impl(const Table& other, const expr::Expression& condition,
                                 std::optional<std::string> title, bool left) const -> Table;
    [[nodiscard]] auto join_target(const Table& other, std::optional<std::string> title) const
        -> Table;
    void validate_row(Row& row) const;

    ColumnRegistry columns_;
    std::vector<Row> rows_;
    std::optional<std::string> title_;
    mutable Meta meta_;
    std::optional<std::string> primary_index_;
    std::optional<std::string> version_;
    std::vector<Formatter> formatters_;
    TableRef ref_;
};

/// One-column table from a list of values, converted to their common type.
[[nodiscard]] auto to_table(const std::string& name, std::vector<Value> values,
                            ColumnSpec spec = {}, std::optional<std::string> title = std::nullopt,
                            Meta meta = {}) -> Table;

}  // namespace tabula
