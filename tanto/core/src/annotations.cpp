#include "tanto/core/annotations.hpp"

#include <utility>

namespace tanto {

schema apply_annotations(const schema& s, const annotations& meta) {
    if (meta.empty()) {
        return s;
    }

    schema_metadata merged = s.metadata();
    if (meta.description) {
        merged.description = *meta.description;
    }
    if (meta.default_value) {
        merged.default_value = *meta.default_value;
    }
    if (meta.encoded_example) {
        merged.example = *meta.encoded_example;
    }
    if (meta.format) {
        merged.format = *meta.format;
    }
    if (meta.deprecated) {
        merged.deprecated = *meta.deprecated;
    }
    if (meta.validate) {
        merged.validators.push_back(*meta.validate);
    }
    return s.with_metadata(std::move(merged));
}

} // namespace tanto
