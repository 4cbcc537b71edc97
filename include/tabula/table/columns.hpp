#pragma once

#include <tabula/core/format.hpp>
#include <tabula/core/value.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tabula {

/// True for names used by the Table API itself, which columns may not take.
[[nodiscard]] auto is_reserved_name(std::string_view name) -> bool;

/// Ordered column definitions (name, type, format) with a name -> index map.
class ColumnRegistry {
   public:
    ColumnRegistry() = default;
    /// Throws ShapeMismatch for differing lengths and SchemaError for duplicate
    /// or reserved names.
    ColumnRegistry(std::vector<std::string> names, std::vector<Type> types,
                   std::vector<Format> formats);

    [[nodiscard]] auto size() const noexcept -> std::size_t { return names_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return names_.empty(); }

    [[nodiscard]] auto names() const noexcept -> const std::vector<std::string>& { return names_; }
    [[nodiscard]] auto types() const noexcept -> const std::vector<Type>& { return types_; }
    [[nodiscard]] auto formats() const noexcept -> const std::vector<Format>& { return formats_; }

    [[nodiscard]] auto name(std::size_t index) const -> const std::string& { return names_.at(index); }
    [[nodiscard]] auto type(std::size_t index) const -> const Type& { return types_.at(index); }
    [[nodiscard]] auto format(std::size_t index) const -> const Format& { return formats_.at(index); }

    [[nodiscard]] auto find(std::string_view name) const -> std::optional<std::size_t>;
    /// Throws SchemaError naming the column when absent.
    [[nodiscard]] auto index_of(std::string_view name) const -> std::size_t;
    [[nodiscard]] auto has_column(std::string_view name) const -> bool { return find(name).has_value(); }
    [[nodiscard]] auto has_columns(const std::vector<std::string>& names) const -> bool;

    /// Throws SchemaError listing expected, found and missing names.
    void ensure_columns(const std::vector<std::string>& names) const;

    void set_type(std::string_view name, Type type);
    void set_format(std::string_view name, Format format);

    /// Atomic rename: old names must exist and be distinct, new names must be
    /// unused, distinct, free of "__" and not reserved.
    void rename(const std::map<std::string, std::string>& mapping);

    /// Renames without the "__" check; used for postfix manipulation.
    void rename_unchecked(const std::map<std::string, std::string>& mapping);

    /// Inserts a column definition at `position` (<= size()).
    void insert(std::size_t position, std::string name, Type type, Format format);

    /// Removes the columns at the given indices.
    void erase(std::vector<std::size_t> indices);

    friend auto operator==(const ColumnRegistry& lhs, const ColumnRegistry& rhs) -> bool {
        return lhs.names_ == rhs.names_ && lhs.types_ == rhs.types_ && lhs.formats_ == rhs.formats_;
    }

   private:
    void rebuild_index();

    std::vector<std::string> names_;
    std::vector<Type> types_;
    std::vector<Format> formats_;
    std::unordered_map<std::string, std::size_t> index_;
};

}  // namespace tabula
