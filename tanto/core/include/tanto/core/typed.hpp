#pragma once

#include "configuration.hpp"
#include "derive.hpp"
#include "modify.hpp"
#include "result.hpp"
#include "schema.hpp"
#include "schema_registry.hpp"
#include "type_descriptor.hpp"

#include <concepts>
#include <cstdint>
#include <list>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace tanto {

// Specialize with `static type_descriptor describe();` to make T derivable.
// A type without a specialization is not describable, and every entry point
// below rejects it at compile time.
template <typename T> struct type_description;

template <typename T>
concept describable = requires {
    { type_description<T>::describe() } -> std::convertible_to<type_descriptor>;
};

// The descriptor of T, built once per process.
template <describable T> const type_descriptor& descriptor_of() {
    static const type_descriptor descriptor = type_description<T>::describe();
    return descriptor;
}

// Deferred reference to T's descriptor. Safe to use inside T's own describe().
template <describable T> type_ref ref_to() {
    return type_ref::deferred([]() -> const type_descriptor& { return descriptor_of<T>(); });
}

template <describable T>
[[nodiscard]] result<schema> derive_schema(const configuration& config = {},
                                           const schema_registry* registry = nullptr) {
    return derive(descriptor_of<T>(), config, registry);
}

// Field path checked against T's descriptor.
template <describable T>
[[nodiscard]] result<field_path> path_of(std::vector<path_segment> segments) {
    return make_path(descriptor_of<T>(), std::move(segments));
}

template <> struct type_description<bool> {
    static type_descriptor describe() { return type_descriptor::primitive(primitive_kind::boolean); }
};

template <> struct type_description<int32_t> {
    static type_descriptor describe() {
        return type_descriptor::primitive(primitive_kind::integer, "int32");
    }
};

template <> struct type_description<int64_t> {
    static type_descriptor describe() {
        return type_descriptor::primitive(primitive_kind::integer, "int64");
    }
};

template <> struct type_description<float> {
    static type_descriptor describe() {
        return type_descriptor::primitive(primitive_kind::number, "float");
    }
};

template <> struct type_description<double> {
    static type_descriptor describe() {
        return type_descriptor::primitive(primitive_kind::number, "double");
    }
};

template <> struct type_description<std::string> {
    static type_descriptor describe() { return type_descriptor::primitive(primitive_kind::string); }
};

template <describable T> struct type_description<std::vector<T>> {
    static type_descriptor describe() { return type_descriptor::array(ref_to<T>()); }
};

template <describable T> struct type_description<std::list<T>> {
    static type_descriptor describe() { return type_descriptor::array(ref_to<T>()); }
};

template <describable T> struct type_description<std::set<T>> {
    static type_descriptor describe() { return type_descriptor::array(ref_to<T>()); }
};

template <describable T> struct type_description<std::optional<T>> {
    static type_descriptor describe() { return type_descriptor::optional(ref_to<T>()); }
};

} // namespace tanto
