#include "tanto/core/modify.hpp"

#include <iostream>
#include <utility>

namespace tanto {

namespace {

const unwrapper* find_unwrapper(const schema& node, const unwrap_registry* unwrappers) noexcept {
    if (!unwrappers || !node.name()) {
        return nullptr;
    }
    return unwrappers->find(*node.name());
}

// Derivation emits a reference where a product or coproduct recurs inside
// itself, so a checked path may end on such a node but not descend into it.
bool recurs(const std::vector<const type_descriptor*>& enclosing,
            const type_descriptor& d) noexcept {
    if (d.kind() != type_kind::product && d.kind() != type_kind::coproduct) {
        return false;
    }
    for (const auto* outer : enclosing) {
        if (outer == &d) {
            return true;
        }
        if (d.is_named() && outer->name() == d.name() && outer->kind() == d.kind()) {
            return true;
        }
    }
    return false;
}

void log_unresolved(const field_path& path, size_t position, const schema& node) {
    std::cerr << "[modify] path " << path.to_string() << " does not resolve at segment "
              << position << " (" << to_string(node.kind()) << " node)\n";
}

} // namespace

field_path field_path::field(std::string name) const {
    auto copy = segments_;
    copy.push_back(path_segment::field(std::move(name)));
    return field_path(std::move(copy));
}

field_path field_path::each() const {
    auto copy = segments_;
    copy.push_back(path_segment::each());
    return field_path(std::move(copy));
}

std::string field_path::to_string() const {
    if (segments_.empty()) {
        return "<root>";
    }
    std::string out;
    for (const auto& segment : segments_) {
        if (!out.empty()) {
            out += '.';
        }
        out += segment.kind == segment_kind::each ? std::string(each_segment) : segment.name;
    }
    return out;
}

void unwrap_registry::add(std::string type_name, unwrapper u) {
    unwrappers_.insert_or_assign(std::move(type_name), std::move(u));
}

const unwrapper* unwrap_registry::find(std::string_view type_name) const noexcept {
    auto it = unwrappers_.find(type_name);
    if (it == unwrappers_.end()) {
        return nullptr;
    }
    return &it->second;
}

const schema& schema_lens::get() const {
    const schema* node = &root_;
    for (const auto& s : steps_) {
        if (s.kind == segment_kind::field) {
            node = &node->fields()[s.field_index].type;
        } else if (s.container) {
            node = s.container->element(*node);
        } else {
            node = node->element();
        }
    }
    return *node;
}

schema schema_lens::rebuild(const schema& node,
                            size_t depth,
                            const std::function<schema(const schema&)>& transform) const {
    if (depth == steps_.size()) {
        return transform(node);
    }

    const auto& s = steps_[depth];
    if (s.kind == segment_kind::field) {
        const auto& child = node.fields()[s.field_index].type;
        return node.with_field_schema(s.field_index, rebuild(child, depth + 1, transform));
    }
    if (s.container) {
        const schema* child = s.container->element(node);
        return s.container->rebuild(node, rebuild(*child, depth + 1, transform));
    }
    return node.with_element(rebuild(*node.element(), depth + 1, transform));
}

schema schema_lens::modify(const std::function<schema(const schema&)>& transform) const {
    return rebuild(root_, 0, transform);
}

schema schema_lens::set(schema replacement) const {
    return modify([&replacement](const schema&) { return replacement; });
}

result<schema_lens>
at(const schema& root, const field_path& path, const unwrap_registry* unwrappers) {
    std::vector<schema_lens::step> steps;
    steps.reserve(path.size());

    const schema* node = &root;
    for (size_t i = 0; i < path.segments().size(); ++i) {
        const auto& segment = path.segments()[i];

        if (segment.kind == segment_kind::field) {
            const auto& fields = node->fields();
            size_t index = 0;
            while (index < fields.size() && fields[index].name != segment.name) {
                ++index;
            }
            if (index == fields.size()) {
                log_unresolved(path, i, *node);
                return std::unexpected(make_error_code(error_code::path_not_found));
            }
            steps.push_back({segment_kind::field, index, std::nullopt});
            node = &fields[index].type;
            continue;
        }

        if (node->kind() == schema_kind::array || node->kind() == schema_kind::optional) {
            steps.push_back({segment_kind::each, 0, std::nullopt});
            node = node->element();
            continue;
        }

        const auto* container = find_unwrapper(*node, unwrappers);
        const schema* element = container ? container->element(*node) : nullptr;
        if (!element) {
            log_unresolved(path, i, *node);
            return std::unexpected(make_error_code(error_code::path_not_found));
        }
        steps.push_back({segment_kind::each, 0, *container});
        node = element;
    }

    return schema_lens(root, path, std::move(steps));
}

result<field_path> make_path(const type_descriptor& root, std::vector<path_segment> segments) {
    std::vector<const type_descriptor*> enclosing;
    const type_descriptor* node = &root;
    for (size_t i = 0; i < segments.size(); ++i) {
        const auto& segment = segments[i];

        if (recurs(enclosing, *node)) {
            std::cerr << "[modify] path " << field_path(segments).to_string()
                      << " descends into recursive type " << node->name() << " at segment " << i
                      << "\n";
            return std::unexpected(make_error_code(error_code::invalid_path));
        }
        if (node->kind() == type_kind::product || node->kind() == type_kind::coproduct) {
            enclosing.push_back(node);
        }

        if (segment.kind == segment_kind::field) {
            const auto* f = node->kind() == type_kind::product ? node->find_field(segment.name)
                                                                : nullptr;
            if (!f) {
                return std::unexpected(make_error_code(error_code::invalid_path));
            }
            node = &f->type.get();
            continue;
        }

        if (node->kind() != type_kind::array && node->kind() != type_kind::optional) {
            return std::unexpected(make_error_code(error_code::invalid_path));
        }
        node = &node->element()->get();
    }
    return field_path(std::move(segments));
}

result<schema> modify_unsafe(const schema& root,
                             const std::vector<std::string>& names,
                             const std::function<schema(const schema&)>& transform,
                             const unwrap_registry* unwrappers) {
    // Resolve the ambiguity of "each" against the schema itself: it is an
    // element step only where the node is a container, a field name elsewhere.
    std::vector<path_segment> segments;
    segments.reserve(names.size());

    const schema* node = &root;
    for (const auto& name : names) {
        const bool container =
            node && (node->kind() == schema_kind::array || node->kind() == schema_kind::optional ||
                     find_unwrapper(*node, unwrappers) != nullptr);

        if (name == each_segment && container) {
            segments.push_back(path_segment::each());
            if (node->kind() == schema_kind::array || node->kind() == schema_kind::optional) {
                node = node->element();
            } else {
                node = find_unwrapper(*node, unwrappers)->element(*node);
            }
            continue;
        }

        segments.push_back(path_segment::field(name));
        const auto* f = node ? node->find_field(name) : nullptr;
        node = f ? &f->type : nullptr;
    }

    return modify(root, field_path(std::move(segments)), transform, unwrappers);
}

} // namespace tanto
