#include <tabula/core/digest.hpp>
#include <tabula/table/table.hpp>

#include <robin_hood.h>

#include <algorithm>
#include <bit>
#include <cstdint>
#include <functional>
#include <type_traits>
#include <vector>

namespace tabula {

namespace {

const MetaKey kUniqueIdKey{std::string("unique_id")};

enum class HashTag : std::uint8_t {
    None,
    Bool,
    Int,
    Float,
    Str,
    Object,
    Meta,
    TableRef,
    Format,
    Hidden,
};

void hash_tag(Sha256& h, HashTag tag) { h.update_u64(static_cast<std::uint64_t>(tag)); }

void hash_value(Sha256& h, const Value& value) {
    std::visit(
        [&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                hash_tag(h, HashTag::None);
            } else if constexpr (std::is_same_v<T, bool>) {
                hash_tag(h, HashTag::Bool);
                h.update_u64(v ? 1 : 0);
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                hash_tag(h, HashTag::Int);
                h.update_u64(static_cast<std::uint64_t>(v));
            } else if constexpr (std::is_same_v<T, double>) {
                hash_tag(h, HashTag::Float);
                h.update_u64(std::bit_cast<std::uint64_t>(v));
            } else if constexpr (std::is_same_v<T, std::string>) {
                hash_tag(h, HashTag::Str);
                h.update_field(v);
            } else {
                hash_tag(h, HashTag::Object);
                h.update_field(v->type_name());
                h.update_field(v->unique_id());
            }
        },
        value.storage());
}

void hash_entry(Sha256& h, const MetaValue& value);

// TableRef keys are process local, so entries keyed by them are digested on
// their own and fed in sorted digest order after the named entries.
void hash_meta(Sha256& h, const Meta& meta) {
    std::vector<std::string> ref_digests;
    h.update_u64(meta.size() - (meta.contains(kUniqueIdKey) ? 1 : 0));
    for (const auto& [key, value] : meta.entries()) {
        if (key == kUniqueIdKey) {
            continue;
        }
        if (const auto* name = std::get_if<std::string>(&key)) {
            h.update_field(*name);
            hash_entry(h, value);
        } else {
            Sha256 entry;
            hash_tag(entry, HashTag::TableRef);
            hash_entry(entry, value);
            ref_digests.push_back(entry.hexdigest());
        }
    }
    std::sort(ref_digests.begin(), ref_digests.end());
    for (const auto& digest : ref_digests) {
        h.update_field(digest);
    }
}

void hash_entry(Sha256& h, const MetaValue& value) {
    if (const auto* nested = std::get_if<std::shared_ptr<const Meta>>(&value)) {
        hash_tag(h, HashTag::Meta);
        if (*nested) {
            hash_meta(h, **nested);
        } else {
            hash_tag(h, HashTag::None);
        }
    } else {
        hash_value(h, std::get<Value>(value));
    }
}

}  // namespace

auto Table::unique_id() const -> std::string {
    if (auto cached = meta_.value(kUniqueIdKey); cached.is_string()) {
        return cached.as_string();
    }
    Sha256 h;
    h.update_u64(columns_.size());
    for (const auto& name : columns_.names()) {
        h.update_field(name);
    }
    for (const auto& type : columns_.types()) {
        h.update_field(tabula::to_string(type));
    }
    for (const auto& format : columns_.formats()) {
        if (format.has_value()) {
            hash_tag(h, HashTag::Format);
            h.update_field(*format);
        } else {
            hash_tag(h, HashTag::Hidden);
        }
    }
    hash_meta(h, meta_);
    h.update_u64(rows_.size());
    for (const auto& row : rows_) {
        for (const auto& value : row) {
            hash_value(h, value);
        }
    }
    auto digest = h.hexdigest();
    meta_.set(kUniqueIdKey, Value(digest));
    return digest;
}

auto Table::equals(const Object& other) const -> bool {
    const auto* table = dynamic_cast<const Table*>(&other);
    if (table == nullptr) {
        return false;
    }
    return table == this ||
           (table->columns_ == columns_ && table->title_ == title_ && table->rows_ == rows_);
}

auto Table::hash() const -> std::size_t {
    std::hash<std::string> str_hash;
    std::size_t seed = title_.has_value() ? str_hash(*title_) : 0;
    for (const auto& name : columns_.names()) {
        seed = hash_combine(seed, str_hash(name));
    }
    for (const auto& type : columns_.types()) {
        seed = hash_combine(seed, str_hash(tabula::to_string(type)));
    }
    for (const auto& format : columns_.formats()) {
        seed = hash_combine(seed, format.has_value() ? str_hash(*format) : 0);
    }
    for (const auto& row : rows_) {
        seed = hash_combine(seed, RowHash{}(row));
    }
    return hash_combine(seed, rows_.size());
}

void Table::compress_objects() {
    robin_hood::unordered_flat_map<std::string, ObjectPtr> canonical;
    for (auto& row : rows_) {
        for (auto& cell : row) {
            if (!cell.is_object()) {
                continue;
            }
            const auto& object = cell.as_object();
            auto [it, inserted] = canonical.try_emplace(object->unique_id(), object);
            if (!inserted && it->second != object) {
                cell = Value(it->second);
            }
        }
    }
    reset_internals();
}

}  // namespace tabula
