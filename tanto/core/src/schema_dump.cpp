#include "tanto/core/schema_dump.hpp"

#include <sstream>

namespace tanto {

std::string escape_json(std::string_view sv) {
    std::string out;
    out.reserve(sv.size() + 8);
    for (char c : sv) {
        switch (c) {
        case '\"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            out.push_back(c);
            break;
        }
    }
    return out;
}

namespace {

void dump_string(std::ostringstream& os, std::string_view key, std::string_view value) {
    os << ",\"" << key << "\":\"" << escape_json(value) << "\"";
}

void dump_metadata(std::ostringstream& os, const schema& s) {
    const auto& meta = s.metadata();
    if (meta.format) {
        dump_string(os, "format", *meta.format);
    }
    if (meta.description) {
        dump_string(os, "description", *meta.description);
    }
    if (meta.default_value) {
        dump_string(os, "default", *meta.default_value);
    }
    if (meta.example) {
        dump_string(os, "example", *meta.example);
    }
    if (meta.deprecated) {
        os << ",\"deprecated\":true";
    }
    if (!meta.validators.empty()) {
        dump_string(os, "validate", s.combined_validator().show());
    }
}

void dump_node(std::ostringstream& os, const schema& s) {
    if (s.kind() == schema_kind::reference) {
        os << "{\"$ref\":\"" << escape_json(s.name().value_or("")) << "\"}";
        return;
    }

    os << "{\"type\":\"";
    if (s.kind() == schema_kind::primitive) {
        os << to_string(s.primitive_type());
    } else {
        os << to_string(s.kind());
    }
    os << "\"";
    if (s.name()) {
        dump_string(os, "name", *s.name());
    }

    switch (s.kind()) {
    case schema_kind::array:
    case schema_kind::optional:
        os << ",\"element\":";
        dump_node(os, *s.element());
        break;
    case schema_kind::product: {
        os << ",\"fields\":[";
        bool first_field = true;
        for (const auto& f : s.fields()) {
            if (!first_field) {
                os << ",";
            }
            first_field = false;
            os << "{\"name\":\"" << escape_json(f.name) << "\"";
            if (f.encoded_name != f.name) {
                dump_string(os, "encoded", f.encoded_name);
            }
            os << ",\"schema\":";
            dump_node(os, f.type);
            os << "}";
        }
        os << "]";
        break;
    }
    case schema_kind::coproduct: {
        if (s.discriminator()) {
            dump_string(os, "discriminator", *s.discriminator());
        }
        os << ",\"variants\":[";
        bool first_variant = true;
        for (const auto& v : s.variants()) {
            if (!first_variant) {
                os << ",";
            }
            first_variant = false;
            os << "{";
            if (v.label) {
                os << "\"label\":\"" << escape_json(*v.label) << "\",";
            }
            os << "\"schema\":";
            dump_node(os, v.type);
            os << "}";
        }
        os << "]";
        break;
    }
    case schema_kind::primitive:
    case schema_kind::reference:
        break;
    }

    dump_metadata(os, s);
    os << "}";
}

} // namespace

std::string dump_schema(const schema& s) {
    std::ostringstream os;
    dump_node(os, s);
    return os.str();
}

} // namespace tanto
