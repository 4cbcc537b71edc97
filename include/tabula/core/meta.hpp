#pragma once

#include <tabula/core/value.hpp>

#include <compare>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <variant>

namespace tabula {

/// Identity of a table instance, used as meta key and as expression context key.
struct TableRef {
    std::uint64_t id = 0;

    /// Fresh identity from a process-wide counter.
    [[nodiscard]] static auto next() -> TableRef;

    friend auto operator<=>(const TableRef&, const TableRef&) = default;
};

class Meta;
using MetaKey = std::variant<std::string, TableRef>;
using MetaValue = std::variant<Value, std::shared_ptr<const Meta>>;

/// Table meta data: string or table-identity keys mapped to values or nested meta.
class Meta {
   public:
    using Map = std::map<MetaKey, MetaValue>;

    Meta() = default;
    Meta(std::initializer_list<Map::value_type> entries) : entries_(entries) {}

    void set(MetaKey key, MetaValue value) { entries_.insert_or_assign(std::move(key), std::move(value)); }
    auto erase(const MetaKey& key) -> bool { return entries_.erase(key) > 0; }

    [[nodiscard]] auto contains(const MetaKey& key) const -> bool { return entries_.contains(key); }
    /// Nullptr when absent.
    [[nodiscard]] auto find(const MetaKey& key) const -> const MetaValue*;
    /// Plain value stored under `key`, or None.
    [[nodiscard]] auto value(const MetaKey& key) const -> Value;
    /// Nested meta stored under `key`, or nullptr.
    [[nodiscard]] auto nested(const MetaKey& key) const -> std::shared_ptr<const Meta>;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return entries_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return entries_.empty(); }
    [[nodiscard]] auto entries() const noexcept -> const Map& { return entries_; }

    /// Multi-line rendering for diagnostics.
    [[nodiscard]] auto to_string() const -> std::string;

    friend auto operator==(const Meta& lhs, const Meta& rhs) -> bool;

   private:
    Map entries_;
};

[[nodiscard]] auto to_string(const MetaKey& key) -> std::string;

}  // namespace tabula
