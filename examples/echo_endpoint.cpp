#include "tanto/core/endpoint.hpp"
#include "tanto/core/schema_dump.hpp"

#include <iostream>

using namespace tanto;
using namespace tanto::http;

int main() {
    const auto binary = schema::primitive(primitive_kind::binary);

    auto echo = endpoint::post()
                    .name("echo file")
                    .summary("Returns the uploaded file unchanged")
                    .tag("files")
                    .in_body(content_type::octet_stream, binary)
                    .out_body(content_type::octet_stream, binary)
                    .in_path("/api/echo");
    if (!echo) {
        std::cerr << "invalid endpoint: " << echo.error().message() << "\n";
        return 1;
    }
    std::cout << echo->show() << "\n";

    auto id = schema::primitive(primitive_kind::integer).with_format("int64");
    auto fetch = endpoint::get()
                     .name("get file")
                     .in_header("X-Request-Id", schema::primitive(primitive_kind::string))
                     .out_body(content_type::octet_stream, binary)
                     .error_out(content_type::text_plain, schema::primitive(primitive_kind::string))
                     .in_path("/api/files/{id}", {{"id", id}});
    if (!fetch) {
        std::cerr << "invalid endpoint: " << fetch.error().message() << "\n";
        return 1;
    }
    std::cout << fetch->show() << "\n";
    for (const auto& segment : fetch->path()) {
        if (segment.kind == route_segment_kind::capture && segment.type) {
            std::cout << "  {" << segment.value << "}: " << dump_schema(*segment.type) << "\n";
        }
    }

    // Malformed templates are reported, not thrown.
    auto broken = endpoint::get().in_path("/api/{unterminated");
    std::cout << "broken: " << (broken ? "accepted" : broken.error().message()) << "\n";
    return 0;
}
