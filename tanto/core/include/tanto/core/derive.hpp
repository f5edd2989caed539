#pragma once

#include "configuration.hpp"
#include "result.hpp"
#include "schema.hpp"
#include "schema_registry.hpp"
#include "type_descriptor.hpp"

#include <string_view>

namespace tanto {

// Builds the schema of `type`.
//
// - Named components bound in `registry` use the bound schema as is.
// - Primitives, arrays and optionals map structurally.
// - Product fields keep their declared order; encoded names come from the
//   configuration's member naming unless a field declares encoded_name.
// - Coproduct variants are labelled only when the configuration names a
//   discriminator field; the label is the variant's explicit label or its
//   type name through the discriminator value naming.
// - A product or coproduct reached again while it is still being derived is
//   emitted as schema::ref(name).
// - Field and type annotations are overlaid last.
//
// Fails with derivation_unavailable for an opaque type without a binding, and
// with the construction errors of schema::product / schema::coproduct.
[[nodiscard]] result<schema> derive(const type_descriptor& type,
                                    const configuration& config = {},
                                    const schema_registry* registry = nullptr);

// Locates the product or coproduct named `name` inside `root`, which is how a
// schema::ref produced for a recursive type is resolved.
[[nodiscard]] const schema* find_definition(const schema& root, std::string_view name) noexcept;

} // namespace tanto
