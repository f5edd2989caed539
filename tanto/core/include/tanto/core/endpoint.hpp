#pragma once

#include "result.hpp"
#include "schema.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tanto::http {

enum class method : uint8_t { get, post, put, del, patch, head, options, unknown };

std::string_view method_to_string(method m);

namespace content_type {
inline constexpr std::string_view json = "application/json";
inline constexpr std::string_view text_plain = "text/plain";
inline constexpr std::string_view octet_stream = "application/octet-stream";
} // namespace content_type

constexpr size_t MAX_ROUTE_SEGMENTS = 16;
constexpr size_t MAX_PATH_PARAMS = 16;

enum class route_segment_kind : uint8_t { literal, capture };

struct route_segment {
    route_segment_kind kind{route_segment_kind::literal};
    std::string value; // literal text or capture name
    std::optional<schema> type;

    bool operator==(const route_segment& other) const = default;
};

// Splits "/api/{id}/items" into literal and capture segments. Captures get no
// schema here. Fails with invalid_path_template for a template that is empty,
// lacks the leading '/', has an empty segment, an unterminated or unnamed
// capture, a repeated capture name, or too many segments.
[[nodiscard]] result<std::vector<route_segment>> parse_path_template(std::string_view raw);

struct parameter_input {
    std::string name;
    schema type;
    std::optional<std::string> description;

    bool operator==(const parameter_input& other) const = default;
};

struct body_io {
    std::string content_type;
    schema type;

    bool operator==(const body_io& other) const = default;
};

// Declaration of one HTTP endpoint: where it lives, what it takes and what it
// returns, each with a schema. It only describes; turning it into a route or
// a client call is left to interpreters.
class endpoint {
public:
    static endpoint get() { return endpoint(method::get); }
    static endpoint post() { return endpoint(method::post); }
    static endpoint put() { return endpoint(method::put); }
    static endpoint del() { return endpoint(method::del); }
    static endpoint patch() { return endpoint(method::patch); }

    explicit endpoint(method m = method::get) : method_(m) {}

    // Captures are typed as strings unless `capture_types` names them. A type
    // for a name the template does not capture is an invalid_path_template.
    [[nodiscard]] result<endpoint>
    in_path(std::string_view path_template,
            std::vector<std::pair<std::string, schema>> capture_types = {}) const;

    [[nodiscard]] endpoint in_query(std::string name,
                                    schema type,
                                    std::optional<std::string> description = std::nullopt) const;
    [[nodiscard]] endpoint in_header(std::string name,
                                     schema type,
                                     std::optional<std::string> description = std::nullopt) const;
    [[nodiscard]] endpoint in_body(std::string_view content_type, schema type) const;
    [[nodiscard]] endpoint out_body(std::string_view content_type, schema type) const;
    [[nodiscard]] endpoint error_out(std::string_view content_type, schema type) const;
    [[nodiscard]] endpoint status(int code) const;

    [[nodiscard]] endpoint name(std::string value) const;
    [[nodiscard]] endpoint summary(std::string value) const;
    [[nodiscard]] endpoint description(std::string value) const;
    [[nodiscard]] endpoint tag(std::string value) const;
    [[nodiscard]] endpoint deprecated(bool value = true) const;

    [[nodiscard]] method http_method() const noexcept { return method_; }
    [[nodiscard]] const std::vector<route_segment>& path() const noexcept { return path_; }
    [[nodiscard]] const std::vector<parameter_input>& queries() const noexcept { return queries_; }
    [[nodiscard]] const std::vector<parameter_input>& headers() const noexcept { return headers_; }
    [[nodiscard]] const std::optional<body_io>& input_body() const noexcept { return input_body_; }
    [[nodiscard]] const std::optional<body_io>& output_body() const noexcept { return output_body_; }
    [[nodiscard]] const std::optional<body_io>& error_output() const noexcept { return error_output_; }
    [[nodiscard]] int status_code() const noexcept { return status_; }

    [[nodiscard]] const std::optional<std::string>& name() const noexcept { return name_; }
    [[nodiscard]] const std::optional<std::string>& summary() const noexcept { return summary_; }
    [[nodiscard]] const std::optional<std::string>& description() const noexcept {
        return description_;
    }
    [[nodiscard]] const std::vector<std::string>& tags() const noexcept { return tags_; }
    [[nodiscard]] bool is_deprecated() const noexcept { return deprecated_; }

    [[nodiscard]] const route_segment* find_capture(std::string_view capture) const noexcept;

    // "/api/{id}"; "/" when no path was declared.
    [[nodiscard]] std::string path_template() const;

    // One-line summary:
    //   [echo file] POST /api/echo {body: application/octet-stream} -> {body: ...}
    [[nodiscard]] std::string show() const;

private:
    method method_;
    std::vector<route_segment> path_;
    std::vector<parameter_input> queries_;
    std::vector<parameter_input> headers_;
    std::optional<body_io> input_body_;
    std::optional<body_io> output_body_;
    std::optional<body_io> error_output_;
    int status_ = 200;
    std::optional<std::string> name_;
    std::optional<std::string> summary_;
    std::optional<std::string> description_;
    std::vector<std::string> tags_;
    bool deprecated_ = false;
};

} // namespace tanto::http
