#pragma once

#include <tabula/core/value.hpp>

#include <string>

namespace tabula {

/// Opaque binary payload with a free-form kind tag (e.g. "PNG").
class Blob final : public Object {
   public:
    Blob(std::string data, std::string kind = {}) : data_(std::move(data)), kind_(std::move(kind)) {}

    [[nodiscard]] static auto make(std::string data, std::string kind = {}) -> std::shared_ptr<const Blob> {
        return std::make_shared<const Blob>(std::move(data), std::move(kind));
    }

    [[nodiscard]] auto data() const noexcept -> const std::string& { return data_; }
    [[nodiscard]] auto kind() const noexcept -> const std::string& { return kind_; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return data_.size(); }

    [[nodiscard]] auto type_name() const -> std::string override { return "Blob"; }
    [[nodiscard]] auto unique_id() const -> std::string override;
    [[nodiscard]] auto clone() const -> ObjectPtr override;
    [[nodiscard]] auto equals(const Object& other) const -> bool override;
    [[nodiscard]] auto hash() const -> std::size_t override;
    [[nodiscard]] auto to_string() const -> std::string override;
    [[nodiscard]] auto encode() const -> std::string override;

    /// Inverse of encode(); throws LoadError on truncated input.
    [[nodiscard]] static auto decode(std::string_view payload) -> ObjectPtr;

   private:
    std::string data_;
    std::string kind_;
};

}  // namespace tabula
