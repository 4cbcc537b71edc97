#pragma once

#include <tabula/core/value.hpp>

#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace tabula {

/// Rebuilds a cell object from the payload produced by Object::encode().
using ObjectDecoder = std::function<ObjectPtr(std::string_view payload)>;

/// Decoders for persisted object cells, looked up by Object::type_name().
///
/// Domain types living outside the core register themselves here before
/// tables holding them are loaded.
class ObjectRegistry {
   public:
    ObjectRegistry() = default;

    /// Register (or replace) the decoder for `type_name`.
    void register_decoder(std::string type_name, ObjectDecoder decoder) {
        registry_.insert_or_assign(std::move(type_name), std::move(decoder));
    }

    /// Look up a decoder by type name.
    [[nodiscard]] auto find(const std::string& type_name) const -> const ObjectDecoder* {
        if (auto it = registry_.find(type_name); it != registry_.end()) {
            return &it->second;
        }
        return nullptr;
    }

    [[nodiscard]] auto contains(const std::string& type_name) const -> bool {
        return registry_.contains(type_name);
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return registry_.size(); }

    /// Decode a payload; throws LoadError for unknown type names.
    [[nodiscard]] auto decode(const std::string& type_name, std::string_view payload) const
        -> ObjectPtr;

    /// Process-wide registry with the built-in Table and Blob decoders.
    /// Register domain types at startup, before loading tables concurrently.
    [[nodiscard]] static auto global() -> ObjectRegistry&;

   private:
    std::unordered_map<std::string, ObjectDecoder> registry_;
};

}  // namespace tabula
