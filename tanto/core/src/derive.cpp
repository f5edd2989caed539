#include "tanto/core/derive.hpp"

#include "tanto/core/annotations.hpp"

#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace tanto {

namespace {

struct derivation_context {
    const configuration& config;
    const schema_registry* registry;
    std::vector<const type_descriptor*> in_progress;
};

std::string effective_name(const type_descriptor& d) {
    if (d.type_annotations().encoded_name) {
        return *d.type_annotations().encoded_name;
    }
    return d.name();
}

bool is_in_progress(const derivation_context& ctx, const type_descriptor& d) noexcept {
    for (const auto* active : ctx.in_progress) {
        if (active == &d) {
            return true;
        }
        if (d.is_named() && active->name() == d.name() && active->kind() == d.kind()) {
            return true;
        }
    }
    return false;
}

schema finish(const type_descriptor& d, schema s) {
    if (d.is_named()) {
        s = s.with_name(effective_name(d));
    }
    return apply_annotations(s, d.type_annotations());
}

result<schema> derive_type(const type_descriptor& d, derivation_context& ctx);

result<schema> derive_product(const type_descriptor& d, derivation_context& ctx) {
    std::vector<field> fields;
    fields.reserve(d.fields().size());

    for (const auto& f : d.fields()) {
        auto derived = derive_type(f.type.get(), ctx);
        if (!derived) {
            return std::unexpected(derived.error());
        }

        schema s = std::move(*derived);
        if (f.default_value) {
            s = s.with_default(*f.default_value);
        }
        s = apply_annotations(s, f.meta);

        // Naming policy first, explicit encoded name wins.
        std::string encoded =
            f.meta.encoded_name ? *f.meta.encoded_name : ctx.config.to_encoded_name(f.name);
        fields.push_back(field{f.name, std::move(encoded), std::move(s)});
    }

    return schema::product(std::move(fields));
}

result<schema> derive_coproduct(const type_descriptor& d, derivation_context& ctx) {
    const auto& discriminator = ctx.config.discriminator();

    std::vector<variant> variants;
    variants.reserve(d.variants().size());

    for (size_t i = 0; i < d.variants().size(); ++i) {
        const auto& v = d.variants()[i];
        const auto& variant_type = v.type.get();

        auto derived = derive_type(variant_type, ctx);
        if (!derived) {
            return std::unexpected(derived.error());
        }

        std::optional<std::string> label;
        if (discriminator) {
            if (v.label) {
                label = *v.label;
            } else {
                std::string base = effective_name(variant_type);
                if (base.empty()) {
                    base = "variant" + std::to_string(i);
                }
                label = ctx.config.to_discriminator_value(base);
            }
        }
        variants.push_back(variant{std::move(label), std::move(*derived)});
    }

    return schema::coproduct(std::move(variants), discriminator);
}

result<schema> derive_type(const type_descriptor& d, derivation_context& ctx) {
    if (d.is_named() && ctx.registry) {
        if (const auto* bound = ctx.registry->find(d.name())) {
            return *bound;
        }
    }

    switch (d.kind()) {
    case type_kind::primitive: {
        auto s = schema::primitive(d.primitive_type());
        if (d.format()) {
            s = s.with_format(*d.format());
        }
        return finish(d, std::move(s));
    }
    case type_kind::array:
    case type_kind::optional: {
        auto element = derive_type(d.element()->get(), ctx);
        if (!element) {
            return std::unexpected(element.error());
        }
        auto s = d.kind() == type_kind::array ? schema::array(std::move(*element))
                                              : schema::optional(std::move(*element));
        return finish(d, std::move(s));
    }
    case type_kind::product:
    case type_kind::coproduct: {
        if (is_in_progress(ctx, d)) {
            return schema::ref(effective_name(d));
        }
        ctx.in_progress.push_back(&d);
        auto built = d.kind() == type_kind::product ? derive_product(d, ctx)
                                                    : derive_coproduct(d, ctx);
        ctx.in_progress.pop_back();
        if (!built) {
            return built;
        }
        return finish(d, std::move(*built));
    }
    case type_kind::opaque:
        break;
    }

    std::cerr << "[derive] no schema available for " << to_string(d.kind()) << " type "
              << (d.is_named() ? d.name() : std::string("<unnamed>")) << "\n";
    return std::unexpected(make_error_code(error_code::derivation_unavailable));
}

} // namespace

result<schema> derive(const type_descriptor& type,
                      const configuration& config,
                      const schema_registry* registry) {
    derivation_context ctx{config, registry, {}};
    return derive_type(type, ctx);
}

const schema* find_definition(const schema& root, std::string_view name) noexcept {
    const auto kind = root.kind();
    if (kind == schema_kind::reference) {
        return nullptr;
    }
    if ((kind == schema_kind::product || kind == schema_kind::coproduct) && root.name() &&
        *root.name() == name) {
        return &root;
    }
    if (const auto* element = root.element()) {
        if (const auto* found = find_definition(*element, name)) {
            return found;
        }
    }
    for (const auto& f : root.fields()) {
        if (const auto* found = find_definition(f.type, name)) {
            return found;
        }
    }
    for (const auto& v : root.variants()) {
        if (const auto* found = find_definition(v.type, name)) {
            return found;
        }
    }
    return nullptr;
}

} // namespace tanto
