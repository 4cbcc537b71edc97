#include <tabula/core/blob.hpp>
#include <tabula/core/error.hpp>
#include <tabula/core/object_registry.hpp>
#include <tabula/table/table.hpp>

#include <fmt/format.h>

namespace tabula {

auto ObjectRegistry::decode(const std::string& type_name, std::string_view payload) const
    -> ObjectPtr {
    const auto* decoder = find(type_name);
    if (decoder == nullptr) {
        throw LoadError(fmt::format("no decoder registered for object type {}", type_name));
    }
    return (*decoder)(payload);
}

auto ObjectRegistry::global() -> ObjectRegistry& {
    static ObjectRegistry registry = [] {
        ObjectRegistry r;
        r.register_decoder("Blob", &Blob::decode);
        r.register_decoder("Table", [](std::string_view payload) -> ObjectPtr {
            return Table::decode(payload);
        });
        return r;
    }();
    return registry;
}

}  // namespace tabula
