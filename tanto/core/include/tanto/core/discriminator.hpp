#pragma once

#include "result.hpp"
#include "schema.hpp"

#include <functional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace tanto {

// Coproduct schema keyed by a discriminator field, together with the function
// mapping a concrete T to its label. The schema drives documentation; the
// label function lets a codec pick the variant for an instance.
template <typename T> class discriminated_schema {
public:
    discriminated_schema(schema coproduct, std::function<std::string(const T&)> label_fn)
        : schema_(std::move(coproduct)), label_fn_(std::move(label_fn)) {}

    [[nodiscard]] const schema& get() const noexcept { return schema_; }
    [[nodiscard]] const std::string& field_name() const noexcept { return *schema_.discriminator(); }

    [[nodiscard]] std::string label_of(const T& instance) const { return label_fn_(instance); }

    // nullptr when the instance's label is not one of the mapped variants.
    [[nodiscard]] const schema* variant_for(const T& instance) const {
        const auto* v = schema_.find_variant(label_of(instance));
        return v ? &v->type : nullptr;
    }

private:
    schema schema_;
    std::function<std::string(const T&)> label_fn_;
};

// Builds a coproduct with one variant per (value, schema) pair, labelled by
// render(value), and the discriminator field set to `field_name`. Fails with
// duplicate_variant_label when two values render to the same label.
//
//   auto entity = one_of_using_field<entity_t>(
//       "kind", [](const entity_t& e) { return e.kind; }, kind_name,
//       {{kind::person, person}, {kind::org, organization}});
template <typename T, typename Extract, typename Render>
[[nodiscard]] result<discriminated_schema<T>>
one_of_using_field(std::string field_name,
                   Extract extractor,
                   Render render,
                   std::vector<std::pair<std::invoke_result_t<Extract, const T&>, schema>> mapping) {
    std::vector<variant> variants;
    variants.reserve(mapping.size());
    for (auto& [key, s] : mapping) {
        variants.push_back(variant{std::string(render(key)), std::move(s)});
    }

    auto coproduct = schema::coproduct(std::move(variants), std::move(field_name));
    if (!coproduct) {
        return std::unexpected(coproduct.error());
    }

    return discriminated_schema<T>(
        std::move(*coproduct),
        [extractor = std::move(extractor), render = std::move(render)](const T& instance) {
            return std::string(render(extractor(instance)));
        });
}

// Attaches a discriminator to an already derived coproduct. Each mapping entry
// labels the first variant not labelled by an earlier entry whose schema has
// the same name, or failing that, is structurally equal. Variant schemas are
// kept as they are.
//
// Fails with not_a_coproduct, discriminator_already_set,
// unknown_discriminator_variant (an entry matches no variant) or
// duplicate_variant_label.
[[nodiscard]] result<schema>
add_discriminator_field(std::string field_name,
                        const schema& coproduct,
                        const std::vector<std::pair<std::string, schema>>& mapping);

} // namespace tanto
