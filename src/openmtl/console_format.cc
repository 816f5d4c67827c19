#include "openmtl/console_format.h"

#include <cstdio>

namespace openmtl {

bool
append_console_escaped_ascii(std::string_view s, uint32_t max_bytes,
                             std::string* out) noexcept
{
    bool dangerous   = false;
    const uint32_t n = (max_bytes == 0U || s.size() < max_bytes)
                           ? static_cast<uint32_t>(s.size())
                           : max_bytes;

    for (uint32_t i = 0; i < n; ++i) {
        const unsigned char c = static_cast<unsigned char>(s[i]);
        switch (c) {
        case '\\':
        case '"':
            out->push_back('\\');
            out->push_back(static_cast<char>(c));
            continue;
        case '\n': out->append("\\n"); dangerous = true; continue;
        case '\r': out->append("\\r"); dangerous = true; continue;
        case '\t': out->append("\\t"); dangerous = true; continue;
        default: break;
        }
        if (c < 0x20U || c == 0x7FU || c >= 0x80U) {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "\\x%02X",
                          static_cast<unsigned>(c));
            out->append(buf);
            dangerous = true;
            continue;
        }
        out->push_back(static_cast<char>(c));
    }
    if (n < s.size()) {
        out->append("...");
        dangerous = true;
    }
    return dangerous;
}


void
append_console_value(const MtlValue& v, uint32_t max_bytes, std::string* out)
{
    switch (v.kind) {
    case MtlValueKind::Empty: out->push_back('-'); return;
    case MtlValueKind::Int:
    case MtlValueKind::Float: append_value_string(v, out); return;
    case MtlValueKind::Text:
        out->push_back('"');
        (void)append_console_escaped_ascii(v.text, max_bytes, out);
        out->push_back('"');
        return;
    }
}


std::string_view
value_kind_name(MtlValueKind kind) noexcept
{
    switch (kind) {
    case MtlValueKind::Empty: return "empty";
    case MtlValueKind::Int: return "int";
    case MtlValueKind::Float: return "float";
    case MtlValueKind::Text: return "text";
    }
    return "unknown";
}

}  // namespace openmtl
