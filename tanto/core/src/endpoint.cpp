#include "tanto/core/endpoint.hpp"

#include <algorithm>

namespace tanto::http {

std::string_view method_to_string(method m) {
    switch (m) {
    case method::get:
        return "GET";
    case method::post:
        return "POST";
    case method::put:
        return "PUT";
    case method::del:
        return "DELETE";
    case method::patch:
        return "PATCH";
    case method::head:
        return "HEAD";
    case method::options:
        return "OPTIONS";
    case method::unknown:
        break;
    }
    return "UNKNOWN";
}

namespace {

std::unexpected<std::error_code> invalid_template() {
    return std::unexpected(make_error_code(error_code::invalid_path_template));
}

std::string render_body(const std::optional<body_io>& body) {
    if (!body) {
        return "-";
    }
    return "{body: " + body->content_type + "}";
}

} // namespace

result<std::vector<route_segment>> parse_path_template(std::string_view raw) {
    if (raw.empty() || raw.front() != '/') {
        return invalid_template();
    }

    std::vector<route_segment> segments;
    size_t captures = 0;
    size_t pos = 1; // skip leading '/'

    while (pos < raw.size()) {
        size_t next_slash = raw.find('/', pos);
        if (next_slash == std::string_view::npos) {
            next_slash = raw.size();
        }

        const size_t len = next_slash - pos;
        if (len == 0 || segments.size() >= MAX_ROUTE_SEGMENTS) {
            return invalid_template();
        }

        std::string_view segment = raw.substr(pos, len);
        if (segment.front() == '{') {
            if (segment.back() != '}' || segment.size() <= 2 || captures >= MAX_PATH_PARAMS) {
                return invalid_template();
            }
            std::string name(segment.substr(1, segment.size() - 2));
            auto duplicate = std::find_if(segments.begin(), segments.end(), [&](const auto& s) {
                return s.kind == route_segment_kind::capture && s.value == name;
            });
            if (duplicate != segments.end()) {
                return invalid_template();
            }
            segments.push_back(route_segment{route_segment_kind::capture, std::move(name), {}});
            ++captures;
        } else {
            if (segment.find_first_of("{}") != std::string_view::npos) {
                return invalid_template();
            }
            segments.push_back(route_segment{route_segment_kind::literal, std::string(segment), {}});
        }

        pos = next_slash + 1;
    }

    // "/a/" leaves an empty trailing segment
    if (raw.size() > 1 && raw.back() == '/') {
        return invalid_template();
    }
    return segments;
}

result<endpoint>
endpoint::in_path(std::string_view path_template,
                  std::vector<std::pair<std::string, schema>> capture_types) const {
    auto segments = parse_path_template(path_template);
    if (!segments) {
        return std::unexpected(segments.error());
    }

    for (auto& segment : *segments) {
        if (segment.kind == route_segment_kind::capture) {
            segment.type = schema::primitive(primitive_kind::string);
        }
    }
    for (auto& [capture, type] : capture_types) {
        auto it = std::find_if(segments->begin(), segments->end(), [&](const auto& s) {
            return s.kind == route_segment_kind::capture && s.value == capture;
        });
        if (it == segments->end()) {
            return invalid_template();
        }
        it->type = std::move(type);
    }

    endpoint copy = *this;
    copy.path_ = std::move(*segments);
    return copy;
}

endpoint endpoint::in_query(std::string name,
                            schema type,
                            std::optional<std::string> description) const {
    endpoint copy = *this;
    copy.queries_.push_back({std::move(name), std::move(type), std::move(description)});
    return copy;
}

endpoint endpoint::in_header(std::string name,
                             schema type,
                             std::optional<std::string> description) const {
    endpoint copy = *this;
    copy.headers_.push_back({std::move(name), std::move(type), std::move(description)});
    return copy;
}

endpoint endpoint::in_body(std::string_view content_type, schema type) const {
    endpoint copy = *this;
    copy.input_body_ = body_io{std::string(content_type), std::move(type)};
    return copy;
}

endpoint endpoint::out_body(std::string_view content_type, schema type) const {
    endpoint copy = *this;
    copy.output_body_ = body_io{std::string(content_type), std::move(type)};
    return copy;
}

endpoint endpoint::error_out(std::string_view content_type, schema type) const {
    endpoint copy = *this;
    copy.error_output_ = body_io{std::string(content_type), std::move(type)};
    return copy;
}

endpoint endpoint::status(int code) const {
    endpoint copy = *this;
    copy.status_ = code;
    return copy;
}

endpoint endpoint::name(std::string value) const {
    endpoint copy = *this;
    copy.name_ = std::move(value);
    return copy;
}

endpoint endpoint::summary(std::string value) const {
    endpoint copy = *this;
    copy.summary_ = std::move(value);
    return copy;
}

endpoint endpoint::description(std::string value) const {
    endpoint copy = *this;
    copy.description_ = std::move(value);
    return copy;
}

endpoint endpoint::tag(std::string value) const {
    endpoint copy = *this;
    copy.tags_.push_back(std::move(value));
    return copy;
}

endpoint endpoint::deprecated(bool value) const {
    endpoint copy = *this;
    copy.deprecated_ = value;
    return copy;
}

const route_segment* endpoint::find_capture(std::string_view capture) const noexcept {
    for (const auto& segment : path_) {
        if (segment.kind == route_segment_kind::capture && segment.value == capture) {
            return &segment;
        }
    }
    return nullptr;
}

std::string endpoint::path_template() const {
    if (path_.empty()) {
        return "/";
    }
    std::string out;
    for (const auto& segment : path_) {
        out += '/';
        if (segment.kind == route_segment_kind::capture) {
            out += '{';
            out += segment.value;
            out += '}';
        } else {
            out += segment.value;
        }
    }
    return out;
}

std::string endpoint::show() const {
    std::string out;
    if (name_) {
        out += "[" + *name_ + "] ";
    }
    out += method_to_string(method_);
    out += ' ';
    out += path_template();

    for (size_t i = 0; i < queries_.size(); ++i) {
        out += i == 0 ? '?' : '&';
        out += queries_[i].name;
    }
    for (const auto& h : headers_) {
        out += " {header " + h.name + "}";
    }
    if (input_body_) {
        out += ' ';
        out += render_body(input_body_);
    }

    out += " -> ";
    out += render_body(output_body_);
    if (error_output_) {
        out += " / ";
        out += render_body(error_output_);
    }
    return out;
}

} // namespace tanto::http
