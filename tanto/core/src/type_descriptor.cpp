#include "tanto/core/type_descriptor.hpp"

#include <utility>

namespace tanto {

std::string_view to_string(type_kind kind) noexcept {
    switch (kind) {
    case type_kind::primitive:
        return "primitive";
    case type_kind::array:
        return "array";
    case type_kind::optional:
        return "optional";
    case type_kind::product:
        return "product";
    case type_kind::coproduct:
        return "coproduct";
    case type_kind::opaque:
        return "opaque";
    }
    return "unknown";
}

type_ref::type_ref(type_descriptor descriptor)
    : owned_(std::make_shared<const type_descriptor>(std::move(descriptor))) {}

type_ref type_ref::deferred(resolver fn) {
    type_ref ref;
    ref.deferred_ = std::move(fn);
    return ref;
}

type_ref type_ref::to(const type_descriptor& descriptor) {
    const type_descriptor* target = &descriptor;
    return deferred([target]() -> const type_descriptor& { return *target; });
}

const type_descriptor& type_ref::get() const {
    if (owned_) {
        return *owned_;
    }
    return deferred_();
}

type_descriptor type_descriptor::primitive(primitive_kind kind, std::optional<std::string> format) {
    type_descriptor d(type_kind::primitive);
    d.primitive_ = kind;
    d.format_ = std::move(format);
    return d;
}

type_descriptor type_descriptor::array(type_ref element) {
    type_descriptor d(type_kind::array);
    d.element_ = std::move(element);
    return d;
}

type_descriptor type_descriptor::optional(type_ref element) {
    type_descriptor d(type_kind::optional);
    d.element_ = std::move(element);
    return d;
}

type_descriptor type_descriptor::product(std::string name) {
    type_descriptor d(type_kind::product);
    d.name_ = std::move(name);
    return d;
}

type_descriptor type_descriptor::coproduct(std::string name) {
    type_descriptor d(type_kind::coproduct);
    d.name_ = std::move(name);
    return d;
}

type_descriptor type_descriptor::opaque(std::string name) {
    type_descriptor d(type_kind::opaque);
    d.name_ = std::move(name);
    return d;
}

type_descriptor type_descriptor::with_name(std::string name) const {
    type_descriptor copy = *this;
    copy.name_ = std::move(name);
    return copy;
}

type_descriptor
type_descriptor::with_field(std::string name, type_ref type, annotations meta) const {
    return with_field(field_descriptor{std::move(name), std::move(type), std::nullopt, std::move(meta)});
}

type_descriptor type_descriptor::with_field(field_descriptor f) const {
    type_descriptor copy = *this;
    copy.fields_.push_back(std::move(f));
    return copy;
}

type_descriptor type_descriptor::with_variant(type_ref type, std::optional<std::string> label) const {
    type_descriptor copy = *this;
    copy.variants_.push_back(variant_descriptor{std::move(label), std::move(type)});
    return copy;
}

type_descriptor type_descriptor::with_annotations(annotations meta) const {
    type_descriptor copy = *this;
    copy.meta_ = std::move(meta);
    return copy;
}

const type_ref* type_descriptor::element() const noexcept {
    if (element_) {
        return &*element_;
    }
    return nullptr;
}

const field_descriptor* type_descriptor::find_field(std::string_view name) const noexcept {
    for (const auto& f : fields_) {
        if (f.name == name) {
            return &f;
        }
    }
    return nullptr;
}

} // namespace tanto
