#include "tanto/core/endpoint.hpp"

#include <gtest/gtest.h>
#include <string>

using namespace tanto;
using namespace tanto::http;

namespace {

schema binary_schema() {
    return schema::primitive(primitive_kind::binary);
}

} // namespace

TEST(HttpMethod, Format) {
    EXPECT_EQ(method_to_string(method::del), "DELETE");
    EXPECT_EQ(method_to_string(method::patch), "PATCH");
    EXPECT_EQ(method_to_string(method::unknown), "UNKNOWN");
}

TEST(PathTemplate, LiteralsAndCaptures) {
    auto segments = parse_path_template("/api/users/{id}/orders");
    ASSERT_TRUE(segments);
    ASSERT_EQ(segments->size(), 4u);
    EXPECT_EQ((*segments)[0].kind, route_segment_kind::literal);
    EXPECT_EQ((*segments)[0].value, "api");
    EXPECT_EQ((*segments)[2].kind, route_segment_kind::capture);
    EXPECT_EQ((*segments)[2].value, "id");
    EXPECT_FALSE((*segments)[2].type);
}

TEST(PathTemplate, RootPath) {
    auto segments = parse_path_template("/");
    ASSERT_TRUE(segments);
    EXPECT_TRUE(segments->empty());
}

TEST(PathTemplate, MalformedTemplates) {
    for (const char* bad : {"", "api", "/api//users", "/api/", "/{", "/{}", "/{id", "/a{b}",
                            "/{id}/{id}"}) {
        auto segments = parse_path_template(bad);
        ASSERT_FALSE(segments) << bad;
        EXPECT_EQ(segments.error(), make_error_code(error_code::invalid_path_template)) << bad;
    }
}

TEST(PathTemplate, SegmentLimit) {
    std::string path;
    for (size_t i = 0; i < MAX_ROUTE_SEGMENTS; ++i) {
        path += "/s";
    }
    EXPECT_TRUE(parse_path_template(path));
    path += "/s";
    EXPECT_FALSE(parse_path_template(path));
}

TEST(Endpoint, EchoFile) {
    auto echo = endpoint::post()
                    .in_body(content_type::octet_stream, binary_schema())
                    .out_body(content_type::octet_stream, binary_schema())
                    .name("echo file")
                    .in_path("/api/echo");
    ASSERT_TRUE(echo);

    EXPECT_EQ(echo->http_method(), method::post);
    EXPECT_EQ(echo->name(), "echo file");
    ASSERT_TRUE(echo->input_body());
    EXPECT_EQ(echo->input_body()->type, binary_schema());
    EXPECT_EQ(echo->show(),
              "[echo file] POST /api/echo {body: application/octet-stream} -> "
              "{body: application/octet-stream}");
}

TEST(Endpoint, TypedCaptures) {
    auto id = schema::primitive(primitive_kind::integer).with_format("int64");
    auto e = endpoint::get().in_path("/users/{id}/posts/{slug}", {{"id", id}});
    ASSERT_TRUE(e);

    ASSERT_NE(e->find_capture("id"), nullptr);
    EXPECT_EQ(e->find_capture("id")->type, id);
    EXPECT_EQ(e->find_capture("slug")->type, schema::primitive(primitive_kind::string));
    EXPECT_EQ(e->find_capture("users"), nullptr);
    EXPECT_EQ(e->path_template(), "/users/{id}/posts/{slug}");
}

TEST(Endpoint, CaptureTypeForUnknownName) {
    auto e = endpoint::get().in_path("/users/{id}", {{"uid", schema::primitive(primitive_kind::string)}});
    ASSERT_FALSE(e);
    EXPECT_EQ(e.error(), make_error_code(error_code::invalid_path_template));
}

TEST(Endpoint, QueryHeadersAndErrors) {
    auto e = endpoint::get()
                 .in_query("limit", schema::primitive(primitive_kind::integer), "Page size")
                 .in_query("cursor", schema::optional(schema::primitive(primitive_kind::string)))
                 .in_header("X-Request-Id", schema::primitive(primitive_kind::string))
                 .out_body(content_type::json, schema::primitive(primitive_kind::string))
                 .error_out(content_type::text_plain, schema::primitive(primitive_kind::string))
                 .in_path("/items");
    ASSERT_TRUE(e);

    ASSERT_EQ(e->queries().size(), 2u);
    EXPECT_EQ(e->queries()[0].description, "Page size");
    EXPECT_FALSE(e->queries()[1].description);
    ASSERT_EQ(e->headers().size(), 1u);
    EXPECT_EQ(e->show(),
              "GET /items?limit&cursor {header X-Request-Id} -> {body: application/json} / "
              "{body: text/plain}");
}

TEST(Endpoint, DocumentationFields) {
    auto e = endpoint::del()
                 .summary("Remove an item")
                 .description("Deletes the item permanently")
                 .tag("items")
                 .tag("admin")
                 .deprecated()
                 .status(204);

    EXPECT_EQ(e.http_method(), method::del);
    EXPECT_EQ(e.summary(), "Remove an item");
    EXPECT_EQ(e.description(), "Deletes the item permanently");
    ASSERT_EQ(e.tags().size(), 2u);
    EXPECT_EQ(e.tags()[1], "admin");
    EXPECT_TRUE(e.is_deprecated());
    EXPECT_EQ(e.status_code(), 204);
    EXPECT_EQ(e.show(), "DELETE / -> -");
}

TEST(Endpoint, BuildersDoNotMutateReceiver) {
    auto base = endpoint::put();
    auto named = base.name("update");
    EXPECT_FALSE(base.name());
    EXPECT_EQ(named.name(), "update");
    EXPECT_EQ(endpoint::patch().http_method(), method::patch);
}
