#pragma once

#include "result.hpp"
#include "validator.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tanto {

enum class schema_kind : uint8_t { primitive, array, optional, product, coproduct, reference };

enum class primitive_kind : uint8_t { string, integer, number, boolean, binary };

std::string_view to_string(schema_kind kind) noexcept;
std::string_view to_string(primitive_kind kind) noexcept;

struct schema_metadata {
    std::optional<std::string> description;
    std::optional<std::string> default_value; // encoded form
    std::optional<std::string> example;       // encoded form
    std::optional<std::string> format;
    bool deprecated = false;
    std::vector<validator> validators;

    bool operator==(const schema_metadata& other) const = default;
};

struct field;
struct variant;
struct schema_node;

// Immutable description of a type's wire shape. Copies share structure; every
// with_* call returns a new schema and leaves the receiver untouched.
class schema {
public:
    static schema primitive(primitive_kind kind);
    static schema array(schema element);
    static schema optional(schema element);

    // Fails with duplicate_field_name when two fields share an encoded name.
    static result<schema> product(std::vector<field> fields);

    // Fails with duplicate_variant_label when two variants share a label.
    static result<schema> coproduct(std::vector<variant> variants,
                                    std::optional<std::string> discriminator = std::nullopt);

    // Placeholder for a named schema defined elsewhere in the same tree.
    static schema ref(std::string name);

    [[nodiscard]] schema_kind kind() const noexcept;
    [[nodiscard]] primitive_kind primitive_type() const noexcept;
    [[nodiscard]] const std::optional<std::string>& name() const noexcept;

    // Element of an array or optional; nullptr for every other kind. A
    // reference carries the name of its target in name().
    [[nodiscard]] const schema* element() const noexcept;

    [[nodiscard]] const std::vector<field>& fields() const noexcept;
    [[nodiscard]] const std::vector<variant>& variants() const noexcept;
    [[nodiscard]] const std::optional<std::string>& discriminator() const noexcept;
    [[nodiscard]] const schema_metadata& metadata() const noexcept;

    [[nodiscard]] const field* find_field(std::string_view name) const noexcept;
    [[nodiscard]] const variant* find_variant(std::string_view label) const noexcept;

    [[nodiscard]] bool is_optional() const noexcept { return kind() == schema_kind::optional; }

    // Conjunction of every validator attached to this node.
    [[nodiscard]] validator combined_validator() const;

    [[nodiscard]] schema with_name(std::string name) const;
    [[nodiscard]] schema with_description(std::string description) const;
    [[nodiscard]] schema with_default(std::string encoded) const;
    [[nodiscard]] schema with_example(std::string encoded) const;
    [[nodiscard]] schema with_format(std::string format) const;
    [[nodiscard]] schema with_deprecated(bool deprecated = true) const;
    [[nodiscard]] schema with_validator(validator v) const;
    [[nodiscard]] schema with_metadata(schema_metadata metadata) const;

    // Structural rebuilds used by the modification engine. with_element is a
    // no-op unless the node is an array or optional; with_field_schema is a
    // no-op for an out-of-range index.
    [[nodiscard]] schema with_element(schema element) const;
    [[nodiscard]] schema with_field_schema(size_t index, schema type) const;

    bool operator==(const schema& other) const;

private:
    explicit schema(std::shared_ptr<const schema_node> node) noexcept : node_(std::move(node)) {}

    template <typename F> [[nodiscard]] schema rebuilt(F&& edit) const;

    std::shared_ptr<const schema_node> node_;
};

struct field {
    std::string name;         // as declared
    std::string encoded_name; // as on the wire
    schema type;

    static field of(std::string name, schema type) {
        std::string encoded = name;
        return field{std::move(name), std::move(encoded), std::move(type)};
    }

    bool operator==(const field& other) const = default;
};

struct variant {
    std::optional<std::string> label; // discriminator value
    schema type;

    bool operator==(const variant& other) const = default;
};

} // namespace tanto
