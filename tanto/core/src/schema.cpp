#include "tanto/core/schema.hpp"

#include <unordered_set>
#include <utility>

namespace tanto {

struct schema_node {
    schema_kind kind{schema_kind::primitive};
    primitive_kind primitive{primitive_kind::string};
    std::optional<std::string> name;
    std::optional<schema> element; // array, optional
    std::vector<field> fields;
    std::vector<variant> variants;
    std::optional<std::string> discriminator;
    schema_metadata meta;
};

namespace {

const std::vector<field>& no_fields() {
    static const std::vector<field> empty;
    return empty;
}

const std::vector<variant>& no_variants() {
    static const std::vector<variant> empty;
    return empty;
}

} // namespace

std::string_view to_string(schema_kind kind) noexcept {
    switch (kind) {
    case schema_kind::primitive:
        return "primitive";
    case schema_kind::array:
        return "array";
    case schema_kind::optional:
        return "optional";
    case schema_kind::product:
        return "product";
    case schema_kind::coproduct:
        return "coproduct";
    case schema_kind::reference:
        return "reference";
    }
    return "unknown";
}

std::string_view to_string(primitive_kind kind) noexcept {
    switch (kind) {
    case primitive_kind::string:
        return "string";
    case primitive_kind::integer:
        return "integer";
    case primitive_kind::number:
        return "number";
    case primitive_kind::boolean:
        return "boolean";
    case primitive_kind::binary:
        return "binary";
    }
    return "unknown";
}

template <typename F> schema schema::rebuilt(F&& edit) const {
    auto copy = std::make_shared<schema_node>(*node_);
    std::forward<F>(edit)(*copy);
    return schema(std::move(copy));
}

schema schema::primitive(primitive_kind kind) {
    auto node = std::make_shared<schema_node>();
    node->kind = schema_kind::primitive;
    node->primitive = kind;
    return schema(std::move(node));
}

schema schema::array(schema element) {
    auto node = std::make_shared<schema_node>();
    node->kind = schema_kind::array;
    node->element = std::move(element);
    return schema(std::move(node));
}

schema schema::optional(schema element) {
    auto node = std::make_shared<schema_node>();
    node->kind = schema_kind::optional;
    node->element = std::move(element);
    return schema(std::move(node));
}

result<schema> schema::product(std::vector<field> fields) {
    std::unordered_set<std::string_view> seen;
    seen.reserve(fields.size());
    for (const auto& f : fields) {
        if (!seen.insert(f.encoded_name).second) {
            return std::unexpected(make_error_code(error_code::duplicate_field_name));
        }
    }

    auto node = std::make_shared<schema_node>();
    node->kind = schema_kind::product;
    node->fields = std::move(fields);
    return schema(std::move(node));
}

result<schema> schema::coproduct(std::vector<variant> variants,
                                 std::optional<std::string> discriminator) {
    std::unordered_set<std::string_view> seen;
    seen.reserve(variants.size());
    for (const auto& v : variants) {
        if (v.label && !seen.insert(*v.label).second) {
            return std::unexpected(make_error_code(error_code::duplicate_variant_label));
        }
    }

    auto node = std::make_shared<schema_node>();
    node->kind = schema_kind::coproduct;
    node->variants = std::move(variants);
    node->discriminator = std::move(discriminator);
    return schema(std::move(node));
}

schema schema::ref(std::string name) {
    auto node = std::make_shared<schema_node>();
    node->kind = schema_kind::reference;
    node->name = std::move(name);
    return schema(std::move(node));
}

schema_kind schema::kind() const noexcept {
    return node_->kind;
}

primitive_kind schema::primitive_type() const noexcept {
    return node_->primitive;
}

const std::optional<std::string>& schema::name() const noexcept {
    return node_->name;
}

const schema* schema::element() const noexcept {
    if (node_->element) {
        return &*node_->element;
    }
    return nullptr;
}

const std::vector<field>& schema::fields() const noexcept {
    if (node_->kind != schema_kind::product) {
        return no_fields();
    }
    return node_->fields;
}

const std::vector<variant>& schema::variants() const noexcept {
    if (node_->kind != schema_kind::coproduct) {
        return no_variants();
    }
    return node_->variants;
}

const std::optional<std::string>& schema::discriminator() const noexcept {
    return node_->discriminator;
}

const schema_metadata& schema::metadata() const noexcept {
    return node_->meta;
}

const field* schema::find_field(std::string_view name) const noexcept {
    for (const auto& f : fields()) {
        if (f.name == name) {
            return &f;
        }
    }
    return nullptr;
}

const variant* schema::find_variant(std::string_view label) const noexcept {
    for (const auto& v : variants()) {
        if (v.label && *v.label == label) {
            return &v;
        }
    }
    return nullptr;
}

validator schema::combined_validator() const {
    return validator::all(node_->meta.validators);
}

schema schema::with_name(std::string name) const {
    return rebuilt([&](schema_node& n) { n.name = std::move(name); });
}

schema schema::with_description(std::string description) const {
    return rebuilt([&](schema_node& n) { n.meta.description = std::move(description); });
}

schema schema::with_default(std::string encoded) const {
    return rebuilt([&](schema_node& n) { n.meta.default_value = std::move(encoded); });
}

schema schema::with_example(std::string encoded) const {
    return rebuilt([&](schema_node& n) { n.meta.example = std::move(encoded); });
}

schema schema::with_format(std::string format) const {
    return rebuilt([&](schema_node& n) { n.meta.format = std::move(format); });
}

schema schema::with_deprecated(bool deprecated) const {
    return rebuilt([&](schema_node& n) { n.meta.deprecated = deprecated; });
}

schema schema::with_validator(validator v) const {
    return rebuilt([&](schema_node& n) { n.meta.validators.push_back(std::move(v)); });
}

schema schema::with_metadata(schema_metadata metadata) const {
    return rebuilt([&](schema_node& n) { n.meta = std::move(metadata); });
}

schema schema::with_element(schema element) const {
    if (node_->kind != schema_kind::array && node_->kind != schema_kind::optional) {
        return *this;
    }
    return rebuilt([&](schema_node& n) { n.element = std::move(element); });
}

schema schema::with_field_schema(size_t index, schema type) const {
    if (node_->kind != schema_kind::product || index >= node_->fields.size()) {
        return *this;
    }
    return rebuilt([&](schema_node& n) { n.fields[index].type = std::move(type); });
}

bool schema::operator==(const schema& other) const {
    if (node_ == other.node_) {
        return true;
    }
    const auto& a = *node_;
    const auto& b = *other.node_;
    if (a.kind != b.kind || a.name != b.name || a.discriminator != b.discriminator ||
        a.meta != b.meta) {
        return false;
    }
    if (a.kind == schema_kind::primitive && a.primitive != b.primitive) {
        return false;
    }
    return a.element == b.element && a.fields == b.fields && a.variants == b.variants;
}

} // namespace tanto
