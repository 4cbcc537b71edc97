#include <tabula/core/error.hpp>
#include <tabula/io/csv.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <rapidcsv.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <regex>

namespace tabula::io {

namespace {

auto trim(std::string_view text) -> std::string_view {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

auto try_int(std::string_view text, std::int64_t& out) -> bool {
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
    }
    const char* end = text.data() + text.size();
    auto result = std::from_chars(text.data(), end, out);
    return !text.empty() && result.ec == std::errc() && result.ptr == end;
}

auto try_double(const std::string& text, double& out) -> bool {
    char* end_ptr = nullptr;
    out = std::strtod(text.c_str(), &end_ptr);
    return !text.empty() && end_ptr != text.c_str() && *end_ptr == '\0';
}

auto column_label(std::string_view raw) -> std::string {
    static const std::regex spaces(" +");
    return std::regex_replace(std::string(trim(raw)), spaces, "_");
}

}  // namespace

auto best_convert(std::string_view text) -> Value {
    std::int64_t iv{};
    if (try_int(text, iv)) {
        return Value(iv);
    }
    std::string owned(text);
    double dv{};
    if (try_double(owned, dv)) {
        return Value(dv);
    }
    std::replace(owned.begin(), owned.end(), ',', '.');
    if (try_double(owned, dv)) {
        return Value(dv);
    }
    return Value(std::string(text));
}

auto store_csv(const Table& table, const std::filesystem::path& path, bool only_visible)
    -> std::filesystem::path {
    auto extension = path.extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (extension != ".CSV") {
        throw ArgumentError(fmt::format("{} has wrong file type extension", path.string()));
    }

    auto target = path;
    for (int i = 1; std::filesystem::exists(target); ++i) {
        spdlog::debug("{} exists", target.string());
        target = std::filesystem::path(fmt::format("{}.{}", path.string(), i));
    }

    auto names = only_visible ? table.visible_column_names() : table.column_names();
    std::vector<std::size_t> indices;
    indices.reserve(names.size());
    for (const auto& name : names) {
        indices.push_back(table.col_index(name));
    }

    std::ofstream out(target);
    if (!out) {
        throw IoError(fmt::format("can not open {} for writing", target.string()));
    }
    out << fmt::format("{}\n", fmt::join(names, "; "));
    for (const auto& row : table.rows()) {
        std::vector<std::string> cells;
        cells.reserve(indices.size());
        for (auto index : indices) {
            cells.push_back(row[index].to_string());
        }
        out << fmt::format("{}\n", fmt::join(cells, "; "));
    }
    out.close();
    if (!out) {
        throw IoError(fmt::format("writing {} failed", target.string()));
    }
    spdlog::info("wrote {} rows to {}", table.size(), target.string());
    return target;
}

auto load_csv(const std::filesystem::path& path, const CsvOptions& options) -> Table {
    if (!std::filesystem::exists(path)) {
        throw IoError(fmt::format("{} does not exist", path.string()));
    }
    std::vector<std::string> names;
    std::vector<std::vector<Value>> columns;
    try {
        rapidcsv::Document doc(path.string(), rapidcsv::LabelParams(0, -1),
                               rapidcsv::SeparatorParams(options.separator));
        for (const auto& raw : doc.GetColumnNames()) {
            names.push_back(column_label(raw));
        }
        columns.resize(names.size());
        for (std::size_t r = 0; r < doc.GetRowCount(); ++r) {
            auto cells = doc.GetRow<std::string>(r);
            if (cells.size() != names.size()) {
                spdlog::warn("{}: row {} has {} fields, header has {}", path.string(), r + 1,
                             cells.size(), names.size());
            }
            for (std::size_t c = 0; c < names.size(); ++c) {
                if (c >= cells.size()) {
                    columns[c].emplace_back();
                    continue;
                }
                auto cell = trim(cells[c]);
                if (!options.keep_none && cell == "None") {
                    columns[c].emplace_back();
                } else {
                    columns[c].push_back(best_convert(cell));
                }
            }
        }
    } catch (const std::out_of_range& e) {
        throw LoadError(fmt::format("can not parse {}: {}", path.string(), e.what()));
    } catch (const std::ios_base::failure& e) {
        throw IoError(fmt::format("can not read {}: {}", path.string(), e.what()));
    }

    std::vector<Type> types;
    std::vector<Format> formats;
    for (std::size_t c = 0; c < names.size(); ++c) {
        columns[c] = convert_to_common_type(std::move(columns[c]));
        types.push_back(common_type_for(columns[c]));
        if (auto it = options.formats.find(names[c]); it != options.formats.end()) {
            formats.push_back(it->second);
        } else {
            formats.emplace_back(guess_format(names[c], types.back()));
        }
    }

    std::size_t n = columns.empty() ? 0 : columns.front().size();
    std::vector<Row> rows(n);
    for (std::size_t r = 0; r < n; ++r) {
        rows[r].reserve(names.size());
        for (auto& column : columns) {
            rows[r].push_back(std::move(column[r]));
        }
    }

    Meta meta;
    meta.set(std::string("loaded_from"), Value(std::filesystem::absolute(path).string()));
    return Table::create(std::move(names), std::move(types), std::move(formats), std::move(rows),
                         path.filename().string(), std::move(meta));
}

}  // namespace tabula::io
