#include "tanto/core/naming.hpp"

#include <cctype>

namespace tanto {

namespace {

bool is_upper(char c) {
    return std::isupper(static_cast<unsigned char>(c)) != 0;
}

bool is_lower_or_digit(char c) {
    return std::islower(static_cast<unsigned char>(c)) != 0 ||
           std::isdigit(static_cast<unsigned char>(c)) != 0;
}

std::string split_words(std::string_view name, char separator) {
    std::string out;
    out.reserve(name.size() + 4);
    for (size_t i = 0; i < name.size(); ++i) {
        const char c = name[i];
        if (is_upper(c)) {
            const bool after_lower = i > 0 && is_lower_or_digit(name[i - 1]);
            // Last capital of an acronym that starts a new word: "HTTPServer" -> "http_server".
            const bool acronym_end = i > 0 && is_upper(name[i - 1]) && i + 1 < name.size() &&
                                     std::islower(static_cast<unsigned char>(name[i + 1])) != 0;
            if (after_lower || acronym_end) {
                out.push_back(separator);
            }
            out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        } else {
            out.push_back(c);
        }
    }
    return out;
}

} // namespace

std::string to_snake_case(std::string_view name) {
    return split_words(name, '_');
}

std::string to_kebab_case(std::string_view name) {
    return split_words(name, '-');
}

std::optional<naming_style> parse_naming_style(std::string_view text) noexcept {
    if (text == "identity") {
        return naming_style::identity;
    }
    if (text == "snake_case" || text == "snake-case") {
        return naming_style::snake_case;
    }
    if (text == "kebab-case" || text == "kebab_case") {
        return naming_style::kebab_case;
    }
    return std::nullopt;
}

std::string_view to_string(naming_style style) noexcept {
    switch (style) {
    case naming_style::identity:
        return "identity";
    case naming_style::snake_case:
        return "snake_case";
    case naming_style::kebab_case:
        return "kebab-case";
    case naming_style::custom:
        return "custom";
    }
    return "unknown";
}

} // namespace tanto
