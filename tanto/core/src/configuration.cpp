#include "tanto/core/configuration.hpp"

#include <utility>

namespace tanto {

std::string configuration::naming::apply(std::string_view name) const {
    switch (style) {
    case naming_style::identity:
        return std::string(name);
    case naming_style::snake_case:
        return to_snake_case(name);
    case naming_style::kebab_case:
        return to_kebab_case(name);
    case naming_style::custom:
        return custom ? custom(name) : std::string(name);
    }
    return std::string(name);
}

configuration configuration::with_snake_case_member_names() const {
    return with_member_names(naming_style::snake_case);
}

configuration configuration::with_kebab_case_member_names() const {
    return with_member_names(naming_style::kebab_case);
}

configuration configuration::with_custom_member_names(naming_function fn) const {
    configuration copy = *this;
    copy.member_names_ = naming{naming_style::custom, std::move(fn)};
    return copy;
}

configuration configuration::with_member_names(naming_style style) const {
    configuration copy = *this;
    copy.member_names_ = naming{style, {}};
    return copy;
}

configuration configuration::with_discriminator(std::string field_name) const {
    configuration copy = *this;
    copy.discriminator_ = std::move(field_name);
    return copy;
}

configuration configuration::without_discriminator() const {
    configuration copy = *this;
    copy.discriminator_.reset();
    return copy;
}

configuration configuration::with_snake_case_discriminator_values() const {
    configuration copy = *this;
    copy.discriminator_values_ = naming{naming_style::snake_case, {}};
    return copy;
}

configuration configuration::with_kebab_case_discriminator_values() const {
    configuration copy = *this;
    copy.discriminator_values_ = naming{naming_style::kebab_case, {}};
    return copy;
}

configuration configuration::with_custom_discriminator_values(naming_function fn) const {
    configuration copy = *this;
    copy.discriminator_values_ = naming{naming_style::custom, std::move(fn)};
    return copy;
}

std::string configuration::to_encoded_name(std::string_view field_name) const {
    return member_names_.apply(field_name);
}

std::string configuration::to_discriminator_value(std::string_view type_name) const {
    if (discriminator_values_) {
        return discriminator_values_->apply(type_name);
    }
    return member_names_.apply(type_name);
}

} // namespace tanto
