#pragma once

#include "schema.hpp"
#include "validator.hpp"

#include <optional>
#include <string>

namespace tanto {

// Metadata declared next to a field or a type. Every member is optional; only
// the present ones are overlaid onto the derived schema.
struct annotations {
    std::optional<std::string> encoded_name;
    std::optional<std::string> description;
    std::optional<std::string> default_value;
    std::optional<std::string> encoded_example;
    std::optional<std::string> format;
    std::optional<bool> deprecated;
    std::optional<tanto::validator> validate;

    [[nodiscard]] bool empty() const noexcept {
        return !encoded_name && !description && !default_value && !encoded_example && !format &&
               !deprecated && !validate;
    }

    bool operator==(const annotations& other) const = default;
};

// Description, default, example, format and deprecation replace what the
// schema carries; the validator is appended. encoded_name is not a schema
// property and is resolved by the caller (field name or type name).
[[nodiscard]] schema apply_annotations(const schema& s, const annotations& meta);

} // namespace tanto
