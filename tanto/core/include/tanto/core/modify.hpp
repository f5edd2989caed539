#pragma once

#include "result.hpp"
#include "schema.hpp"
#include "type_descriptor.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tanto {

enum class segment_kind : uint8_t { field, each };

// Name of the "each element" segment in unsafe string paths.
inline constexpr std::string_view each_segment = "each";

struct path_segment {
    segment_kind kind{segment_kind::field};
    std::string name; // field segments only

    static path_segment field(std::string name) {
        return path_segment{segment_kind::field, std::move(name)};
    }
    static path_segment each() { return path_segment{segment_kind::each, {}}; }

    bool operator==(const path_segment& other) const = default;
};

// Location of a sub-schema. Field segments match the declared (source) field
// name, so a path does not depend on the naming policy used for derivation.
class field_path {
public:
    field_path() = default;
    explicit field_path(std::vector<path_segment> segments) : segments_(std::move(segments)) {}

    [[nodiscard]] field_path field(std::string name) const;
    [[nodiscard]] field_path each() const;

    [[nodiscard]] const std::vector<path_segment>& segments() const noexcept { return segments_; }
    [[nodiscard]] bool empty() const noexcept { return segments_.empty(); }
    [[nodiscard]] size_t size() const noexcept { return segments_.size(); }

    // "fruits.each.amount"; "<root>" for the empty path.
    [[nodiscard]] std::string to_string() const;

    bool operator==(const field_path& other) const = default;

private:
    std::vector<path_segment> segments_;
};

// Makes "each" work on a named container schema that is neither an array nor
// an optional: `element` reads the contained schema, `rebuild` puts a
// replacement back.
struct unwrapper {
    std::function<const schema*(const schema&)> element;
    std::function<schema(const schema&, schema)> rebuild;
};

class unwrap_registry {
public:
    void add(std::string type_name, unwrapper u);
    [[nodiscard]] const unwrapper* find(std::string_view type_name) const noexcept;

private:
    std::map<std::string, unwrapper, std::less<>> unwrappers_;
};

// Focus on one node of a schema tree. Obtained from at(), which resolves the
// whole path first, so modify() and get() cannot fail. The lens keeps its own
// copy of any unwrapper it uses and does not refer to the registry afterwards.
class schema_lens {
public:
    [[nodiscard]] const schema& root() const noexcept { return root_; }
    [[nodiscard]] const field_path& path() const noexcept { return path_; }

    [[nodiscard]] const schema& get() const;

    // New root where only the focused node is replaced by `transform(node)`.
    [[nodiscard]] schema modify(const std::function<schema(const schema&)>& transform) const;
    [[nodiscard]] schema set(schema replacement) const;

private:
    friend result<schema_lens>
    at(const schema& root, const field_path& path, const unwrap_registry* unwrappers);

    struct step {
        segment_kind kind;
        size_t field_index = 0;
        std::optional<unwrapper> container; // each-segment on a custom container
    };

    schema_lens(schema root, field_path path, std::vector<step> steps)
        : root_(std::move(root)), path_(std::move(path)), steps_(std::move(steps)) {}

    [[nodiscard]] schema rebuild(const schema& node,
                                 size_t depth,
                                 const std::function<schema(const schema&)>& transform) const;

    schema root_;
    field_path path_;
    std::vector<step> steps_;
};

// Resolves `path` inside `root`. Fails with path_not_found (and applies
// nothing) when a field segment meets a node without that field, or an each
// segment meets a node that is not an array, an optional or a registered
// container.
[[nodiscard]] result<schema_lens>
at(const schema& root, const field_path& path, const unwrap_registry* unwrappers = nullptr);

template <typename F>
[[nodiscard]] result<schema> modify(const schema& root,
                                    const field_path& path,
                                    F&& transform,
                                    const unwrap_registry* unwrappers = nullptr) {
    auto lens = at(root, path, unwrappers);
    if (!lens) {
        return std::unexpected(lens.error());
    }
    return lens->modify(std::function<schema(const schema&)>(std::forward<F>(transform)));
}

// Builds a path from segments after checking it against a type descriptor:
// every field segment must name a field of a product, every each segment must
// meet an array or optional. Opaque types end the check (invalid_path), since
// their structure is unknown. A type that recurs inside itself is derived as a
// reference at the inner occurrence, so the path may end there but not go
// further (invalid_path); edit the outer definition instead.
[[nodiscard]] result<field_path> make_path(const type_descriptor& root,
                                           std::vector<path_segment> segments);

// Unchecked variant: plain names, with "each" descending into an array,
// optional or registered container. Nothing verifies the names up front; a
// typo or a schema change is only discovered when this runs, as path_not_found.
[[nodiscard]] result<schema> modify_unsafe(const schema& root,
                                           const std::vector<std::string>& names,
                                           const std::function<schema(const schema&)>& transform,
                                           const unwrap_registry* unwrappers = nullptr);

} // namespace tanto
