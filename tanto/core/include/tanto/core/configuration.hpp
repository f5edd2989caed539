#pragma once

#include "naming.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace tanto {

using naming_function = std::function<std::string(std::string_view)>;

// Derivation policy: how field names are encoded and how coproducts are
// discriminated. Immutable; every with_* call returns a modified copy.
class configuration {
public:
    configuration() = default;

    [[nodiscard]] configuration with_snake_case_member_names() const;
    [[nodiscard]] configuration with_kebab_case_member_names() const;
    [[nodiscard]] configuration with_custom_member_names(naming_function fn) const;
    [[nodiscard]] configuration with_member_names(naming_style style) const;

    [[nodiscard]] configuration with_discriminator(std::string field_name) const;
    [[nodiscard]] configuration without_discriminator() const;

    // Discriminator values default to the member naming when not set.
    [[nodiscard]] configuration with_snake_case_discriminator_values() const;
    [[nodiscard]] configuration with_kebab_case_discriminator_values() const;
    [[nodiscard]] configuration with_custom_discriminator_values(naming_function fn) const;

    [[nodiscard]] std::string to_encoded_name(std::string_view field_name) const;
    [[nodiscard]] std::string to_discriminator_value(std::string_view type_name) const;

    [[nodiscard]] const std::optional<std::string>& discriminator() const noexcept {
        return discriminator_;
    }
    [[nodiscard]] naming_style member_naming() const noexcept { return member_names_.style; }
    [[nodiscard]] naming_style discriminator_value_naming() const noexcept {
        return discriminator_values_ ? discriminator_values_->style : member_names_.style;
    }

private:
    struct naming {
        naming_style style = naming_style::identity;
        naming_function custom;

        [[nodiscard]] std::string apply(std::string_view name) const;
    };

    naming member_names_;
    std::optional<naming> discriminator_values_;
    std::optional<std::string> discriminator_;
};

} // namespace tanto
