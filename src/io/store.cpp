#include <tabula/core/error.hpp>
#include <tabula/io/codec.hpp>
#include <tabula/table/table.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <fstream>
#include <iterator>

namespace tabula {

namespace {

auto from_payload(io::TablePayload payload) -> Table {
    return Table::create(std::move(payload.names), std::move(payload.types),
                         std::move(payload.formats), std::move(payload.rows),
                         std::move(payload.title), std::move(payload.meta));
}

auto read_file(const std::filesystem::path& path) -> std::string {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw IoError(fmt::format("can not open {} for reading", path.string()));
    }
    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw IoError(fmt::format("reading {} failed", path.string()));
    }
    return data;
}

// Legacy record, tried on the part after the first line and then on the whole file.
auto load_legacy(std::string_view payload, std::string_view whole) -> Table {
    try {
        return from_payload(io::decode_legacy(payload));
    } catch (const Error& e) {
        spdlog::debug("legacy decode after first line failed: {}", e.what());
    }
    try {
        return from_payload(io::decode_legacy(whole));
    } catch (const Error& e) {
        spdlog::debug("legacy decode of whole file failed: {}", e.what());
        throw LoadError(fmt::format("file has invalid format: {}", e.what()));
    }
}

}  // namespace

auto Table::encode() const -> std::string {
    return io::encode_payload(io::TablePayload{.names = column_names(),
                                               .types = column_types(),
                                               .formats = column_formats(),
                                               .title = title_,
                                               .meta = meta_,
                                               .rows = rows_});
}

auto Table::decode(std::string_view payload) -> std::shared_ptr<const Table> {
    return std::make_shared<const Table>(from_payload(io::decode_strict(payload)));
}

void Table::store(const std::filesystem::path& path, const StoreOptions& options) {
    if (!options.force_overwrite && std::filesystem::exists(path)) {
        throw IoError(fmt::format("{} exists. You may use force_overwrite", path.string()));
    }
    if (options.compressed) {
        compress_objects();
    }
    auto payload = encode();
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw IoError(fmt::format("can not open {} for writing", path.string()));
    }
    out << io::kVersionHeader << '\n';
    out.write(payload.data(), static_cast<std::streamsize>(payload.size()));
    out.close();
    if (!out) {
        throw IoError(fmt::format("writing {} failed", path.string()));
    }
    spdlog::info("stored table with {} rows to {}", rows_.size(), path.string());
}

auto Table::load(const std::filesystem::path& path) -> Table {
    auto data = read_file(path);
    std::string_view whole(data);
    auto newline = whole.find('\n');
    auto first_line = whole.substr(0, newline);
    auto payload = newline == std::string_view::npos ? std::string_view{} : whole.substr(newline + 1);

    if (!first_line.starts_with(io::kVersionPrefix)) {
        spdlog::debug("{} has no version header", path.string());
        return load_legacy(payload, whole);
    }
    try {
        Table table = from_payload(io::decode_strict(payload));
        table.version_ = std::string(first_line.substr(io::kVersionPrefix.size()));
        table.meta_.set(std::string("loaded_from"),
                        Value(std::filesystem::absolute(path).string()));
        return table;
    } catch (const Error& e) {
        spdlog::debug("strict decode of {} failed: {}", path.string(), e.what());
    }
    return load_legacy(payload, whole);
}

}  // namespace tabula
