#include <tabula/core/error.hpp>
#include <tabula/core/postfix.hpp>
#include <tabula/table/table.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace tabula {

namespace {

auto meta_without_cache(const Meta& meta) -> std::shared_ptr<const Meta> {
    auto copy = std::make_shared<Meta>(meta);
    copy->erase(MetaKey{std::string("unique_id")});
    return copy;
}

// Debug progress of long running joins, in steps of 10 percent.
class JoinProgress {
   public:
    explicit JoinProgress(std::size_t total) : total_(total) {}

    void update(std::size_t done) {
        if (total_ == 0) {
            return;
        }
        auto percent = static_cast<int>(100.0 * static_cast<double>(done + 1) /
                                        static_cast<double>(total_));
        if (percent >= last_ + 10) {
            spdlog::debug("join: {}% done", percent);
            last_ = percent;
        }
    }

   private:
    std::size_t total_;
    int last_ = 0;
};

}  // namespace

auto Table::join_target(const Table& other, std::optional<std::string> title) const -> Table {
    int increment = max_postfix() - other.min_postfix() + 1;

    std::vector<std::string> names = column_names();
    std::vector<Type> types = column_types();
    std::vector<Format> formats = column_formats();
    for (std::size_t i = 0; i < other.num_columns(); ++i) {
        names.push_back(shift_postfix(other.columns_.name(i), increment));
        types.push_back(other.columns_.type(i));
        formats.push_back(other.columns_.format(i));
    }
    if (!title.has_value()) {
        title = fmt::format("{} vs {}", title_.value_or("None"), other.title_.value_or("None"));
    }
    Meta meta;
    meta.set(ref_, meta_without_cache(meta_));
    meta.set(other.ref_, meta_without_cache(other.meta_));
    return Table(Unchecked{},
                 ColumnRegistry(std::move(names), std::move(types), std::move(formats)), {},
                 std::move(title), std::move(meta));
}

auto Table::join_impl(const Table& other, const expr::Expression& condition,
                      std::optional<std::string> title, bool left) const -> Table {
    if (other.ref_ == ref_) {
        throw ArgumentError("can not join a table with itself, join with a copy instead");
    }

    std::vector<std::string> left_needed;
    std::vector<std::string> right_needed;
    auto refs = expr::referenced_columns(*condition.node());
    for (const auto& ref : refs) {
        if (ref.table == ref_) {
            left_needed.push_back(ref.name);
        } else if (ref.table == other.ref_) {
            right_needed.push_back(ref.name);
        } else {
            throw ArgumentError(fmt::format(
                "join condition {} refers to column {} of a table not taking part in the join",
                condition.to_string(), ref.name));
        }
    }

    Table out = join_target(other, std::move(title));
    const auto m = other.rows_.size();
    const Row filler(other.num_columns());

    auto emit = [&](const Row& lhs, const Row& rhs) {
        Row row;
        row.reserve(lhs.size() + rhs.size());
        row.insert(row.end(), lhs.begin(), lhs.end());
        row.insert(row.end(), rhs.begin(), rhs.end());
        out.rows_.push_back(std::move(row));
    };

    if (refs.empty()) {
        auto flags = expr::evaluate(*condition.node(), expr::Context{});
        if (!flags) {
            throw ArgumentError(fmt::format("join failed: {}", flags.error()));
        }
        bool all = std::any_of(flags->values.begin(), flags->values.end(),
                               [](const Value& v) { return v.truthy(); });
        for (const auto& lhs : rows_) {
            if (all && m > 0) {
                for (const auto& rhs : other.rows_) {
                    emit(lhs, rhs);
                }
            } else if (left) {
                emit(lhs, filler);
            }
        }
        out.reset_internals();
        return out;
    }

    std::vector<std::size_t> left_indices;
    for (const auto& name : left_needed) {
        left_indices.push_back(columns_.index_of(name));
    }
    expr::Context context;
    context.emplace(other.ref_, other.context_for(right_needed));

    JoinProgress progress(rows_.size());
    for (std::size_t l = 0; l < rows_.size(); ++l) {
        expr::TableCtx left_ctx;
        for (std::size_t k = 0; k < left_needed.size(); ++k) {
            left_ctx.emplace(left_needed[k],
                             expr::ColumnCtx{.values = {rows_[l][left_indices[k]]},
                                             .sorted = false,
                                             .type = columns_.type(left_indices[k])});
        }
        context.insert_or_assign(ref_, std::move(left_ctx));

        auto flags = expr::evaluate(*condition.node(), context);
        if (!flags) {
            throw ArgumentError(fmt::format("join failed: {}", flags.error()));
        }
        bool matched = false;
        if (flags->values.size() == 1) {
            if (flags->values.front().truthy()) {
                for (const auto& rhs : other.rows_) {
                    emit(rows_[l], rhs);
                }
                matched = m > 0;
            }
        } else if (flags->values.size() == m) {
            for (std::size_t r = 0; r < m; ++r) {
                if (flags->values[r].truthy()) {
                    emit(rows_[l], other.rows_[r]);
                    matched = true;
                }
            }
        } else {
            throw ShapeMismatch(fmt::format(
                "join condition yields {} values, expected 1 or {}", flags->values.size(), m));
        }
        if (left && !matched) {
            emit(rows_[l], filler);
        }
        progress.update(l);
    }
    out.reset_internals();
    return out;
}

auto Table::join(const Table& other, const expr::Expression& condition,
                 std::optional<std::string> title) const -> Table {
    return join_impl(other, condition, std::move(title), false);
}

auto Table::join(const Object& other, const expr::Expression& condition,
                 std::optional<std::string> title) const -> Table {
    const auto* table = dynamic_cast<const Table*>(&other);
    if (table == nullptr) {
        throw ArgumentError(fmt::format("can not join object of type {}", other.type_name()));
    }
    return join_impl(*table, condition, std::move(title), false);
}

auto Table::left_join(const Table& other, const expr::Expression& condition,
                      std::optional<std::string> title) const -> Table {
    return join_impl(other, condition, std::move(title), true);
}

auto Table::left_join(const Object& other, const expr::Expression& condition,
                      std::optional<std::string> title) const -> Table {
    const auto* table = dynamic_cast<const Table*>(&other);
    if (table == nullptr) {
        throw ArgumentError(fmt::format("can not join object of type {}", other.type_name()));
    }
    return join_impl(*table, condition, std::move(title), true);
}

}  // namespace tabula
