#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace tanto {

// Error codes reported when a validator is checked against a decoded value.
enum class validation_error_code : uint8_t {
    invalid_type,
    string_too_short,
    string_too_long,
    invalid_enum_value,
    pattern_mismatch,
    invalid_pattern,
    value_too_small,
    value_too_large,
    value_below_exclusive_minimum,
    value_above_exclusive_maximum,
    array_too_small,
    array_too_large,
    custom_predicate_failed,
    unknown_predicate,
    unknown_projection,
};

inline constexpr std::string_view validation_error_message(validation_error_code code) noexcept {
    switch (code) {
    case validation_error_code::invalid_type:
        return "invalid type";
    case validation_error_code::string_too_short:
        return "string too short";
    case validation_error_code::string_too_long:
        return "string too long";
    case validation_error_code::invalid_enum_value:
        return "invalid enum value";
    case validation_error_code::pattern_mismatch:
        return "pattern mismatch";
    case validation_error_code::invalid_pattern:
        return "pattern is not a valid regular expression";
    case validation_error_code::value_too_small:
        return "value too small";
    case validation_error_code::value_too_large:
        return "value too large";
    case validation_error_code::value_below_exclusive_minimum:
        return "value must be greater than minimum";
    case validation_error_code::value_above_exclusive_maximum:
        return "value must be less than maximum";
    case validation_error_code::array_too_small:
        return "array too small";
    case validation_error_code::array_too_large:
        return "array too large";
    case validation_error_code::custom_predicate_failed:
        return "custom predicate failed";
    case validation_error_code::unknown_predicate:
        return "unknown custom predicate";
    case validation_error_code::unknown_projection:
        return "unknown projection";
    }
    return "unknown error";
}

struct validation_error {
    std::string path;              // Element path, e.g. "[2]"; empty for the value itself
    validation_error_code code;    // Error code (type-safe)
    double constraint_value = 0.0; // Optional: constraint value for context (min/max/etc)

    [[nodiscard]] std::string_view message() const noexcept {
        return validation_error_message(code);
    }
};

} // namespace tanto
