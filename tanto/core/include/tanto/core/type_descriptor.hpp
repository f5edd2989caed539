#pragma once

#include "annotations.hpp"
#include "schema.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tanto {

enum class type_kind : uint8_t { primitive, array, optional, product, coproduct, opaque };

std::string_view to_string(type_kind kind) noexcept;

class type_descriptor;

// Reference to a component type. Either owns an inline descriptor or defers to
// a resolver that is only invoked when the descriptor is needed, which is how a
// type refers to itself (directly or through other types).
class type_ref {
public:
    using resolver = std::function<const type_descriptor&()>;

    type_ref(type_descriptor descriptor);

    static type_ref deferred(resolver fn);

    // Non-owning; `descriptor` must outlive every derivation that uses the ref.
    static type_ref to(const type_descriptor& descriptor);

    [[nodiscard]] const type_descriptor& get() const;

private:
    type_ref() = default;

    std::shared_ptr<const type_descriptor> owned_;
    resolver deferred_;
};

struct field_descriptor {
    std::string name;
    type_ref type;
    std::optional<std::string> default_value;
    annotations meta;
};

struct variant_descriptor {
    std::optional<std::string> label; // defaults to the variant type's name
    type_ref type;
};

// Structural description of a type, supplied by the caller instead of being
// discovered through reflection. Named descriptors (products, coproducts,
// opaque types and any descriptor given a name) are identified by that name.
class type_descriptor {
public:
    static type_descriptor primitive(primitive_kind kind,
                                     std::optional<std::string> format = std::nullopt);
    static type_descriptor array(type_ref element);
    static type_descriptor optional(type_ref element);
    static type_descriptor product(std::string name);
    static type_descriptor coproduct(std::string name);

    // A type without structure; derivation needs a registry binding for it.
    static type_descriptor opaque(std::string name);

    [[nodiscard]] type_descriptor with_name(std::string name) const;
    [[nodiscard]] type_descriptor with_field(std::string name,
                                             type_ref type,
                                             annotations meta = {}) const;
    [[nodiscard]] type_descriptor with_field(field_descriptor f) const;
    [[nodiscard]] type_descriptor with_variant(type_ref type,
                                               std::optional<std::string> label = std::nullopt) const;
    [[nodiscard]] type_descriptor with_annotations(annotations meta) const;

    [[nodiscard]] type_kind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] bool is_named() const noexcept { return !name_.empty(); }
    [[nodiscard]] primitive_kind primitive_type() const noexcept { return primitive_; }
    [[nodiscard]] const std::optional<std::string>& format() const noexcept { return format_; }
    [[nodiscard]] const type_ref* element() const noexcept;
    [[nodiscard]] const std::vector<field_descriptor>& fields() const noexcept { return fields_; }
    [[nodiscard]] const std::vector<variant_descriptor>& variants() const noexcept {
        return variants_;
    }
    [[nodiscard]] const annotations& type_annotations() const noexcept { return meta_; }

    [[nodiscard]] const field_descriptor* find_field(std::string_view name) const noexcept;

private:
    explicit type_descriptor(type_kind kind) noexcept : kind_(kind) {}

    type_kind kind_;
    std::string name_;
    primitive_kind primitive_{primitive_kind::string};
    std::optional<std::string> format_;
    std::optional<type_ref> element_;
    std::vector<field_descriptor> fields_;
    std::vector<variant_descriptor> variants_;
    annotations meta_;
};

} // namespace tanto
