#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <system_error>

namespace tanto {

template <typename T> using result = std::expected<T, std::error_code>;

enum class error_code : int {
    ok = 0,
    duplicate_field_name = 1,
    duplicate_variant_label = 2,
    not_a_coproduct = 3,
    discriminator_already_set = 4,
    unknown_discriminator_variant = 5,
    derivation_unavailable = 6,
    path_not_found = 7,
    invalid_path = 8,
    invalid_path_template = 9,
};

// Coarse classes callers match against, e.g. `ec == error_kind::path_not_found`.
enum class error_kind : int {
    schema_construction = 1,
    derivation_unavailable = 2,
    path_not_found = 3,
};

class error_category : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "tanto"; }

    [[nodiscard]] std::string message(int ev) const override {
        using ec = error_code;
        switch (static_cast<ec>(ev)) {
        case ec::ok:
            return "success";
        case ec::duplicate_field_name:
            return "duplicate field name in product schema";
        case ec::duplicate_variant_label:
            return "duplicate variant label in coproduct schema";
        case ec::not_a_coproduct:
            return "schema is not a coproduct";
        case ec::discriminator_already_set:
            return "coproduct already has a discriminator";
        case ec::unknown_discriminator_variant:
            return "discriminator mapping refers to an unknown variant";
        case ec::derivation_unavailable:
            return "no schema available for type";
        case ec::path_not_found:
            return "field path does not match schema";
        case ec::invalid_path:
            return "field path does not match type";
        case ec::invalid_path_template:
            return "invalid path template";
        default:
            return "unknown error";
        }
    }

    [[nodiscard]] std::error_condition default_error_condition(int ev) const noexcept override;
};

class error_kind_category : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "tanto.kind"; }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<error_kind>(ev)) {
        case error_kind::schema_construction:
            return "schema construction error";
        case error_kind::derivation_unavailable:
            return "derivation unavailable";
        case error_kind::path_not_found:
            return "path not found";
        default:
            return "unknown error kind";
        }
    }
};

inline const error_category& get_error_category() {
    static error_category const instance;
    return instance;
}

inline const error_kind_category& get_error_kind_category() {
    static error_kind_category const instance;
    return instance;
}

inline std::error_code make_error_code(error_code e) {
    return {static_cast<int>(e), get_error_category()};
}

inline std::error_condition make_error_condition(error_kind k) {
    return {static_cast<int>(k), get_error_kind_category()};
}

inline std::error_condition error_category::default_error_condition(int ev) const noexcept {
    using ec = error_code;
    switch (static_cast<ec>(ev)) {
    case ec::duplicate_field_name:
    case ec::duplicate_variant_label:
    case ec::not_a_coproduct:
    case ec::discriminator_already_set:
    case ec::unknown_discriminator_variant:
    case ec::invalid_path_template:
        return make_error_condition(error_kind::schema_construction);
    case ec::derivation_unavailable:
        return make_error_condition(error_kind::derivation_unavailable);
    case ec::path_not_found:
    case ec::invalid_path:
        return make_error_condition(error_kind::path_not_found);
    default:
        return {ev, *this};
    }
}

} // namespace tanto

namespace std {
template <> struct is_error_code_enum<tanto::error_code> : true_type {};
template <> struct is_error_condition_enum<tanto::error_kind> : true_type {};
} // namespace std
