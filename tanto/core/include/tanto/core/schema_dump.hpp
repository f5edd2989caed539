#pragma once

#include "schema.hpp"

#include <string>
#include <string_view>

namespace tanto {

std::string escape_json(std::string_view sv);

// Compact single-line JSON summary of a schema tree. Keys appear in a fixed
// order and absent metadata is omitted, so the output is stable enough to
// compare in tests and diff in logs. References render as {"$ref":"Name"}.
std::string dump_schema(const schema& s);

} // namespace tanto
