#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tanto {

enum class naming_style : uint8_t { identity, snake_case, kebab_case, custom };

// "fruitAmount" -> "fruit_amount", "HTTPServer" -> "http_server".
std::string to_snake_case(std::string_view name);

// "fruitAmount" -> "fruit-amount".
std::string to_kebab_case(std::string_view name);

// Accepts "identity", "snake_case" and "kebab-case" (also "snake-case"/"kebab_case").
std::optional<naming_style> parse_naming_style(std::string_view text) noexcept;

std::string_view to_string(naming_style style) noexcept;

} // namespace tanto
