#include "tanto/core/discriminator.hpp"

#include <optional>
#include <vector>

namespace tanto {

namespace {

// First variant not yet labelled by an earlier mapping entry, matched by name
// and then by structure.
std::optional<size_t> match_variant(const std::vector<variant>& variants,
                                    const std::vector<bool>& assigned,
                                    const schema& target) {
    if (target.name()) {
        for (size_t i = 0; i < variants.size(); ++i) {
            if (!assigned[i] && variants[i].type.name() == target.name()) {
                return i;
            }
        }
    }
    for (size_t i = 0; i < variants.size(); ++i) {
        if (!assigned[i] && variants[i].type == target) {
            return i;
        }
    }
    return std::nullopt;
}

} // namespace

result<schema> add_discriminator_field(std::string field_name,
                                       const schema& coproduct,
                                       const std::vector<std::pair<std::string, schema>>& mapping) {
    if (coproduct.kind() != schema_kind::coproduct) {
        return std::unexpected(make_error_code(error_code::not_a_coproduct));
    }
    if (coproduct.discriminator()) {
        return std::unexpected(make_error_code(error_code::discriminator_already_set));
    }

    auto variants = coproduct.variants();
    std::vector<bool> assigned(variants.size(), false);
    for (const auto& [label, target] : mapping) {
        auto index = match_variant(variants, assigned, target);
        if (!index) {
            return std::unexpected(make_error_code(error_code::unknown_discriminator_variant));
        }
        variants[*index].label = label;
        assigned[*index] = true;
    }

    auto labelled = schema::coproduct(std::move(variants), std::move(field_name));
    if (!labelled) {
        return labelled;
    }

    auto out = labelled->with_metadata(coproduct.metadata());
    if (coproduct.name()) {
        out = out.with_name(*coproduct.name());
    }
    return out;
}

} // namespace tanto
