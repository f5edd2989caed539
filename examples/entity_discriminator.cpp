#include "tanto/core/derive.hpp"
#include "tanto/core/discriminator.hpp"
#include "tanto/core/schema_dump.hpp"

#include <iostream>
#include <string>
#include <string_view>

using namespace tanto;

enum class entity_kind { person, organization };

struct entity {
    entity_kind kind;
    std::string name;
};

std::string_view kind_label(entity_kind k) {
    switch (k) {
    case entity_kind::person:
        return "person";
    case entity_kind::organization:
        return "org";
    }
    return "unknown";
}

int main() {
    auto person = type_descriptor::product("Person").with_field(
        "fullName", type_descriptor::primitive(primitive_kind::string));
    auto organization = type_descriptor::product("Organization")
                            .with_field("legalName", type_descriptor::primitive(primitive_kind::string))
                            .with_field("vatNumber",
                                        type_descriptor::optional(
                                            type_descriptor::primitive(primitive_kind::string)));
    auto entity_type = type_descriptor::coproduct("Entity")
                           .with_variant(person, "person")
                           .with_variant(organization, "org");

    // Discriminator chosen by configuration at derivation time.
    auto config = configuration().with_snake_case_member_names().with_discriminator("kind");
    auto derived = derive(entity_type, config);
    if (!derived) {
        std::cerr << "derivation failed: " << derived.error().message() << "\n";
        return 1;
    }
    std::cout << "configured: " << dump_schema(*derived) << "\n";

    // Discriminator attached to an already derived coproduct.
    auto plain = derive(entity_type, configuration().with_snake_case_member_names());
    if (!plain) {
        std::cerr << "derivation failed: " << plain.error().message() << "\n";
        return 1;
    }
    auto attached = add_discriminator_field(
        "kind", *plain, {{"person", plain->variants()[0].type}, {"org", plain->variants()[1].type}});
    if (!attached) {
        std::cerr << "cannot attach discriminator: " << attached.error().message() << "\n";
        return 1;
    }
    std::cout << "attached:   " << dump_schema(*attached) << "\n";

    // Discriminator driven by a value extracted from instances.
    auto by_kind = one_of_using_field<entity>(
        "kind",
        [](const entity& e) { return e.kind; },
        kind_label,
        {{entity_kind::person, plain->variants()[0].type},
         {entity_kind::organization, plain->variants()[1].type}});
    if (!by_kind) {
        std::cerr << "cannot build coproduct: " << by_kind.error().message() << "\n";
        return 1;
    }

    entity acme{entity_kind::organization, "ACME"};
    const auto* variant_schema = by_kind->variant_for(acme);
    std::cout << acme.name << " -> " << by_kind->label_of(acme) << " ("
              << (variant_schema && variant_schema->name() ? *variant_schema->name() : "?") << ")\n";
    return 0;
}
