#include "tanto/core/validator.hpp"

#include <algorithm>
#include <charconv>
#include <optional>
#include <regex>
#include <sstream>
#include <utility>

namespace tanto {

namespace {

std::string format_number(double v) {
    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
    if (ec != std::errc{}) {
        return "nan";
    }
    return std::string(buf, ptr);
}

std::string value_as_text(const value& v) {
    if (const auto* s = std::get_if<std::string>(&v.data)) {
        return *s;
    }
    if (const auto* b = std::get_if<bool>(&v.data)) {
        return *b ? "true" : "false";
    }
    if (const auto* d = std::get_if<double>(&v.data)) {
        return format_number(*d);
    }
    if (v.is_null()) {
        return "null";
    }
    return {};
}

void append(std::vector<validation_error>& out, std::vector<validation_error>&& more) {
    out.insert(out.end(),
               std::make_move_iterator(more.begin()),
               std::make_move_iterator(more.end()));
}

void check_into(const validator& rule,
                const value& v,
                const validator_context& ctx,
                const std::string& path,
                std::vector<validation_error>& out);

void check_bound(const validator& rule,
                 const value& v,
                 const std::string& path,
                 std::vector<validation_error>& out) {
    const auto* number = std::get_if<double>(&v.data);
    if (!number) {
        out.push_back(validation_error{path, validation_error_code::invalid_type, rule.bound()});
        return;
    }
    if (rule.kind() == validator_kind::min) {
        if (rule.exclusive() && *number <= rule.bound()) {
            out.push_back(validation_error{
                path, validation_error_code::value_below_exclusive_minimum, rule.bound()});
        } else if (!rule.exclusive() && *number < rule.bound()) {
            out.push_back(
                validation_error{path, validation_error_code::value_too_small, rule.bound()});
        }
        return;
    }
    if (rule.exclusive() && *number >= rule.bound()) {
        out.push_back(validation_error{
            path, validation_error_code::value_above_exclusive_maximum, rule.bound()});
    } else if (!rule.exclusive() && *number > rule.bound()) {
        out.push_back(validation_error{path, validation_error_code::value_too_large, rule.bound()});
    }
}

void check_length(const validator& rule,
                  const value& v,
                  const std::string& path,
                  std::vector<validation_error>& out) {
    const auto* s = std::get_if<std::string>(&v.data);
    const auto limit = static_cast<double>(rule.size_bound());
    if (!s) {
        out.push_back(validation_error{path, validation_error_code::invalid_type, limit});
        return;
    }
    if (rule.kind() == validator_kind::min_length && s->size() < rule.size_bound()) {
        out.push_back(validation_error{path, validation_error_code::string_too_short, limit});
    } else if (rule.kind() == validator_kind::max_length && s->size() > rule.size_bound()) {
        out.push_back(validation_error{path, validation_error_code::string_too_long, limit});
    }
}

void check_size(const validator& rule,
                const value& v,
                const std::string& path,
                std::vector<validation_error>& out) {
    const auto* items = std::get_if<value::array_type>(&v.data);
    const auto limit = static_cast<double>(rule.size_bound());
    if (!items) {
        out.push_back(validation_error{path, validation_error_code::invalid_type, limit});
        return;
    }
    if (rule.kind() == validator_kind::min_size && items->size() < rule.size_bound()) {
        out.push_back(validation_error{path, validation_error_code::array_too_small, limit});
    } else if (rule.kind() == validator_kind::max_size && items->size() > rule.size_bound()) {
        out.push_back(validation_error{path, validation_error_code::array_too_large, limit});
    }
}

std::optional<value> project(std::string_view projection, const value& v, const validator_context& ctx) {
    if (auto it = ctx.projections.find(projection); it != ctx.projections.end()) {
        return it->second(v);
    }
    if (projection == "length") {
        if (const auto* s = std::get_if<std::string>(&v.data)) {
            return value(static_cast<double>(s->size()));
        }
        if (const auto* items = std::get_if<value::array_type>(&v.data)) {
            return value(static_cast<double>(items->size()));
        }
    }
    return std::nullopt;
}

void check_into(const validator& rule,
                const value& v,
                const validator_context& ctx,
                const std::string& path,
                std::vector<validation_error>& out) {
    switch (rule.kind()) {
    case validator_kind::min:
    case validator_kind::max:
        check_bound(rule, v, path, out);
        return;
    case validator_kind::pattern: {
        const auto* s = std::get_if<std::string>(&v.data);
        if (!s) {
            out.push_back(validation_error{path, validation_error_code::invalid_type});
            return;
        }
        std::regex re;
        try {
            re.assign(rule.text());
        } catch (const std::regex_error&) {
            out.push_back(validation_error{path, validation_error_code::invalid_pattern});
            return;
        }
        if (!std::regex_match(*s, re)) {
            out.push_back(validation_error{path, validation_error_code::pattern_mismatch});
        }
        return;
    }
    case validator_kind::enumeration: {
        const auto text = value_as_text(v);
        const auto& allowed = rule.values();
        if (std::find(allowed.begin(), allowed.end(), text) == allowed.end()) {
            out.push_back(validation_error{path, validation_error_code::invalid_enum_value});
        }
        return;
    }
    case validator_kind::min_length:
    case validator_kind::max_length:
        check_length(rule, v, path, out);
        return;
    case validator_kind::min_size:
    case validator_kind::max_size:
        check_size(rule, v, path, out);
        return;
    case validator_kind::custom: {
        auto it = ctx.predicates.find(rule.text());
        if (it == ctx.predicates.end()) {
            out.push_back(validation_error{path, validation_error_code::unknown_predicate});
        } else if (!it->second(v)) {
            out.push_back(validation_error{path, validation_error_code::custom_predicate_failed});
        }
        return;
    }
    case validator_kind::mapped: {
        auto projected = project(rule.text(), v, ctx);
        if (!projected) {
            out.push_back(validation_error{path, validation_error_code::unknown_projection});
            return;
        }
        check_into(*rule.inner(), *projected, ctx, path, out);
        return;
    }
    case validator_kind::each: {
        if (v.is_null()) {
            return;
        }
        if (const auto* items = std::get_if<value::array_type>(&v.data)) {
            for (size_t i = 0; i < items->size(); ++i) {
                check_into(*rule.inner(),
                           (*items)[i],
                           ctx,
                           path + "[" + std::to_string(i) + "]",
                           out);
            }
            return;
        }
        // A present optional value: the element is the value itself.
        check_into(*rule.inner(), v, ctx, path, out);
        return;
    }
    case validator_kind::all:
        for (const auto& child : rule.children()) {
            std::vector<validation_error> child_errors;
            check_into(child, v, ctx, path, child_errors);
            append(out, std::move(child_errors));
        }
        return;
    }
}

} // namespace

validator validator::min(double bound, bool exclusive) {
    validator v(validator_kind::min);
    v.bound_ = bound;
    v.exclusive_ = exclusive;
    return v;
}

validator validator::max(double bound, bool exclusive) {
    validator v(validator_kind::max);
    v.bound_ = bound;
    v.exclusive_ = exclusive;
    return v;
}

validator validator::pattern(std::string regex) {
    validator v(validator_kind::pattern);
    v.text_ = std::move(regex);
    return v;
}

validator validator::enumeration(std::vector<std::string> values) {
    validator v(validator_kind::enumeration);
    v.values_ = std::move(values);
    return v;
}

validator validator::min_length(size_t length) {
    validator v(validator_kind::min_length);
    v.size_ = length;
    return v;
}

validator validator::max_length(size_t length) {
    validator v(validator_kind::max_length);
    v.size_ = length;
    return v;
}

validator validator::min_size(size_t size) {
    validator v(validator_kind::min_size);
    v.size_ = size;
    return v;
}

validator validator::max_size(size_t size) {
    validator v(validator_kind::max_size);
    v.size_ = size;
    return v;
}

validator validator::custom(std::string predicate_id, std::string description) {
    validator v(validator_kind::custom);
    v.text_ = std::move(predicate_id);
    v.description_ = std::move(description);
    return v;
}

validator validator::mapped(validator inner, std::string projection) {
    validator v(validator_kind::mapped);
    v.text_ = std::move(projection);
    v.children_.push_back(std::move(inner));
    return v;
}

validator validator::each(validator inner) {
    validator v(validator_kind::each);
    v.children_.push_back(std::move(inner));
    return v;
}

validator validator::all(std::vector<validator> conjuncts) {
    validator v(validator_kind::all);
    for (auto& c : conjuncts) {
        if (c.kind_ == validator_kind::all) {
            for (auto& nested : c.children_) {
                v.children_.push_back(std::move(nested));
            }
        } else {
            v.children_.push_back(std::move(c));
        }
    }
    return v;
}

const validator* validator::inner() const noexcept {
    if ((kind_ == validator_kind::each || kind_ == validator_kind::mapped) && !children_.empty()) {
        return &children_.front();
    }
    return nullptr;
}

std::vector<validator> validator::conjuncts() const {
    if (kind_ == validator_kind::all) {
        return children_;
    }
    return {*this};
}

std::string validator::show() const {
    std::ostringstream os;
    switch (kind_) {
    case validator_kind::min:
        os << (exclusive_ ? ">" : ">=") << format_number(bound_);
        break;
    case validator_kind::max:
        os << (exclusive_ ? "<" : "<=") << format_number(bound_);
        break;
    case validator_kind::pattern:
        os << "~" << text_;
        break;
    case validator_kind::enumeration: {
        os << "in(";
        for (size_t i = 0; i < values_.size(); ++i) {
            if (i != 0) {
                os << ",";
            }
            os << values_[i];
        }
        os << ")";
        break;
    }
    case validator_kind::min_length:
        os << "length>=" << size_;
        break;
    case validator_kind::max_length:
        os << "length<=" << size_;
        break;
    case validator_kind::min_size:
        os << "size>=" << size_;
        break;
    case validator_kind::max_size:
        os << "size<=" << size_;
        break;
    case validator_kind::custom:
        os << (description_.empty() ? text_ : description_);
        break;
    case validator_kind::mapped:
        os << text_ << "(" << children_.front().show() << ")";
        break;
    case validator_kind::each:
        os << "elements(" << children_.front().show() << ")";
        break;
    case validator_kind::all:
        if (children_.empty()) {
            os << "pass";
            break;
        }
        for (size_t i = 0; i < children_.size(); ++i) {
            if (i != 0) {
                os << " && ";
            }
            os << children_[i].show();
        }
        break;
    }
    return os.str();
}

validator combine(const validator& first, const validator& second) {
    return validator::all({first, second});
}

std::vector<validation_error>
check(const validator& rule, const value& v, const validator_context& ctx) {
    std::vector<validation_error> errors;
    check_into(rule, v, ctx, std::string{}, errors);
    return errors;
}

} // namespace tanto
