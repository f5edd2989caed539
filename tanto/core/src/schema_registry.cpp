#include "tanto/core/schema_registry.hpp"

#include <iostream>
#include <utility>

namespace tanto {

void schema_registry::bind(std::string type_name, schema s) {
    auto it = bindings_.find(type_name);
    if (it != bindings_.end()) {
        std::cerr << "[schema_registry] replacing binding for " << type_name << "\n";
        it->second = std::move(s);
        return;
    }
    bindings_.emplace(std::move(type_name), std::move(s));
}

bool schema_registry::erase(std::string_view type_name) {
    auto it = bindings_.find(type_name);
    if (it == bindings_.end()) {
        return false;
    }
    bindings_.erase(it);
    return true;
}

const schema* schema_registry::find(std::string_view type_name) const noexcept {
    auto it = bindings_.find(type_name);
    if (it == bindings_.end()) {
        return nullptr;
    }
    return &it->second;
}

} // namespace tanto
