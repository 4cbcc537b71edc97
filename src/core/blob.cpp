#include <tabula/core/blob.hpp>
#include <tabula/core/digest.hpp>
#include <tabula/core/error.hpp>

#include <fmt/format.h>

#include <cstdint>
#include <functional>

namespace tabula {

auto Blob::unique_id() const -> std::string {
    Sha256 h;
    h.update_field(kind_);
    h.update_field(data_);
    return h.hexdigest();
}

auto Blob::clone() const -> ObjectPtr { return std::make_shared<const Blob>(data_, kind_); }

auto Blob::equals(const Object& other) const -> bool {
    const auto* blob = dynamic_cast<const Blob*>(&other);
    return blob != nullptr && blob->kind_ == kind_ && blob->data_ == data_;
}

auto Blob::hash() const -> std::size_t {
    return hash_combine(std::hash<std::string>{}(kind_), std::hash<std::string>{}(data_));
}

auto Blob::to_string() const -> std::string {
    if (kind_.empty()) {
        return fmt::format("<Blob {} bytes>", data_.size());
    }
    return fmt::format("<Blob {} {} bytes>", kind_, data_.size());
}

auto Blob::encode() const -> std::string {
    auto kind_len = static_cast<std::uint32_t>(kind_.size());
    std::string out;
    for (std::size_t i = 0; i < sizeof(kind_len); ++i) {
        out.push_back(static_cast<char>((kind_len >> (8 * i)) & 0xffU));
    }
    out += kind_;
    out += data_;
    return out;
}

auto Blob::decode(std::string_view payload) -> ObjectPtr {
    std::uint32_t kind_len = 0;
    if (payload.size() < sizeof(kind_len)) {
        throw LoadError("blob payload truncated");
    }
    for (std::size_t i = 0; i < sizeof(kind_len); ++i) {
        kind_len |= static_cast<std::uint32_t>(static_cast<unsigned char>(payload[i])) << (8 * i);
    }
    payload.remove_prefix(sizeof(kind_len));
    if (payload.size() < kind_len) {
        throw LoadError("blob payload truncated");
    }
    std::string kind(payload.substr(0, kind_len));
    std::string data(payload.substr(kind_len));
    return std::make_shared<const Blob>(std::move(data), std::move(kind));
}

}  // namespace tabula
