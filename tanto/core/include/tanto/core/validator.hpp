#pragma once

#include "validation.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tanto {

enum class validator_kind : uint8_t {
    min,
    max,
    pattern,
    enumeration,
    min_length,
    max_length,
    min_size,
    max_size,
    custom,
    mapped,
    each,
    all,
};

// A constraint attached to a schema node. Validators are plain values: two
// validators compare equal when they describe the same constraint. Custom
// predicates and projections are referred to by id and supplied at check time
// through a validator_context.
class validator {
public:
    static validator min(double bound, bool exclusive = false);
    static validator max(double bound, bool exclusive = false);
    static validator pattern(std::string regex);
    static validator enumeration(std::vector<std::string> values);
    static validator min_length(size_t length);
    static validator max_length(size_t length);
    static validator min_size(size_t size);
    static validator max_size(size_t size);
    static validator custom(std::string predicate_id, std::string description = {});

    // Applies `inner` to the value produced by the projection named `projection`.
    static validator mapped(validator inner, std::string projection);

    // Applies `inner` to every element of the contained collection.
    static validator each(validator inner);

    // Conjunction. Nested conjunctions are flattened; an empty conjunction always passes.
    static validator all(std::vector<validator> conjuncts);

    [[nodiscard]] validator_kind kind() const noexcept { return kind_; }
    [[nodiscard]] double bound() const noexcept { return bound_; }
    [[nodiscard]] bool exclusive() const noexcept { return exclusive_; }
    [[nodiscard]] size_t size_bound() const noexcept { return size_; }
    [[nodiscard]] const std::string& text() const noexcept { return text_; }
    [[nodiscard]] const std::string& description() const noexcept { return description_; }
    [[nodiscard]] const std::vector<std::string>& values() const noexcept { return values_; }
    [[nodiscard]] const std::vector<validator>& children() const noexcept { return children_; }

    // Inner validator of `each` and `mapped`.
    [[nodiscard]] const validator* inner() const noexcept;

    [[nodiscard]] bool is_pass() const noexcept {
        return kind_ == validator_kind::all && children_.empty();
    }

    // The list of conjuncts: the children of `all`, otherwise the validator itself.
    [[nodiscard]] std::vector<validator> conjuncts() const;

    [[nodiscard]] std::string show() const;

    bool operator==(const validator& other) const = default;

private:
    explicit validator(validator_kind kind) noexcept : kind_(kind) {}

    validator_kind kind_;
    double bound_ = 0.0;
    bool exclusive_ = false;
    size_t size_ = 0;
    std::string text_;
    std::string description_;
    std::vector<std::string> values_;
    std::vector<validator> children_;
};

[[nodiscard]] validator combine(const validator& first, const validator& second);

// Decoded value a validator can be checked against.
struct value {
    using array_type = std::vector<value>;

    value() = default;
    value(bool b) : data(b) {}
    value(int v) : data(static_cast<double>(v)) {}
    value(int64_t v) : data(static_cast<double>(v)) {}
    value(double v) : data(v) {}
    value(std::string s) : data(std::move(s)) {}
    value(const char* s) : data(std::string(s)) {}
    value(array_type items) : data(std::move(items)) {}

    [[nodiscard]] bool is_null() const noexcept {
        return std::holds_alternative<std::monostate>(data);
    }

    std::variant<std::monostate, bool, double, std::string, array_type> data;
};

struct validator_context {
    std::map<std::string, std::function<bool(const value&)>, std::less<>> predicates;
    std::map<std::string, std::function<value(const value&)>, std::less<>> projections;
};

// Checks `v` against `rule`. The built-in projection "length" maps strings and
// arrays to their size; other projections and all custom predicates are looked
// up in `ctx`.
[[nodiscard]] std::vector<validation_error>
check(const validator& rule, const value& v, const validator_context& ctx = {});

} // namespace tanto
