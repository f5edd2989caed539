#pragma once

#include "schema.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace tanto {

// Explicit type-name -> schema bindings consulted by derivation before any
// structural rule. A later bind() for the same name replaces the earlier one.
class schema_registry {
public:
    void bind(std::string type_name, schema s);
    bool erase(std::string_view type_name);

    [[nodiscard]] const schema* find(std::string_view type_name) const noexcept;
    [[nodiscard]] bool contains(std::string_view type_name) const noexcept {
        return find(type_name) != nullptr;
    }
    [[nodiscard]] size_t size() const noexcept { return bindings_.size(); }
    [[nodiscard]] bool empty() const noexcept { return bindings_.empty(); }

private:
    std::map<std::string, schema, std::less<>> bindings_;
};

} // namespace tanto
