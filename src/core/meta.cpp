#include <tabula/core/meta.hpp>

#include <fmt/format.h>

#include <atomic>

namespace tabula {

namespace {

std::atomic<std::uint64_t> next_table_id{1};

auto render(const Meta& meta, int indent) -> std::string {
    std::string out;
    std::string pad(static_cast<std::size_t>(indent) * 2, ' ');
    for (const auto& [key, value] : meta.entries()) {
        if (const auto* nested = std::get_if<std::shared_ptr<const Meta>>(&value)) {
            out += fmt::format("{}{}:\n", pad, to_string(key));
            if (*nested) {
                out += render(**nested, indent + 1);
            }
        } else {
            out += fmt::format("{}{}: {}\n", pad, to_string(key), std::get<Value>(value).repr());
        }
    }
    return out;
}

}  // namespace

auto TableRef::next() -> TableRef {
    return TableRef{next_table_id.fetch_add(1, std::memory_order_relaxed)};
}

auto Meta::find(const MetaKey& key) const -> const MetaValue* {
    if (auto it = entries_.find(key); it != entries_.end()) {
        return &it->second;
    }
    return nullptr;
}

auto Meta::value(const MetaKey& key) const -> Value {
    if (const auto* entry = find(key)) {
        if (const auto* v = std::get_if<Value>(entry)) {
            return *v;
        }
    }
    return {};
}

auto Meta::nested(const MetaKey& key) const -> std::shared_ptr<const Meta> {
    if (const auto* entry = find(key)) {
        if (const auto* v = std::get_if<std::shared_ptr<const Meta>>(entry)) {
            return *v;
        }
    }
    return nullptr;
}

auto Meta::to_string() const -> std::string { return render(*this, 0); }

auto operator==(const Meta& lhs, const Meta& rhs) -> bool {
    if (lhs.entries_.size() != rhs.entries_.size()) {
        return false;
    }
    auto it = rhs.entries_.begin();
    for (const auto& [key, value] : lhs.entries_) {
        if (key != it->first || value.index() != it->second.index()) {
            return false;
        }
        if (const auto* v = std::get_if<Value>(&value)) {
            if (!(*v == std::get<Value>(it->second))) {
                return false;
            }
        } else {
            const auto& a = std::get<std::shared_ptr<const Meta>>(value);
            const auto& b = std::get<std::shared_ptr<const Meta>>(it->second);
            if (a != b && (!a || !b || !(*a == *b))) {
                return false;
            }
        }
        ++it;
    }
    return true;
}

auto to_string(const MetaKey& key) -> std::string {
    if (const auto* name = std::get_if<std::string>(&key)) {
        return *name;
    }
    return fmt::format("<table {}>", std::get<TableRef>(key).id);
}

}  // namespace tabula
