#include "openmtl/mtl_value.h"

#include <charconv>
#include <system_error>

namespace openmtl {
namespace {

    static std::string_view strip_plus(std::string_view s) noexcept
    {
        // from_chars rejects a leading '+'; accept exactly one.
        if (s.size() >= 2 && s[0] == '+' && s[1] != '-' && s[1] != '+') {
            return s.substr(1);
        }
        return s;
    }

    static bool parse_i64(std::string_view s, int64_t* out) noexcept
    {
        s = strip_plus(s);
        if (s.empty()) {
            return false;
        }
        const char* first = s.data();
        const char* last  = s.data() + s.size();
        int64_t v         = 0;
        const std::from_chars_result r = std::from_chars(first, last, v, 10);
        if (r.ec != std::errc() || r.ptr != last) {
            return false;
        }
        *out = v;
        return true;
    }

    static bool parse_f64(std::string_view s, double* out) noexcept
    {
        s = strip_plus(s);
        if (s.empty()) {
            return false;
        }
        const char* first = s.data();
        const char* last  = s.data() + s.size();
        double v          = 0.0;
        const std::from_chars_result r
            = std::from_chars(first, last, v, std::chars_format::general);
        if (r.ec != std::errc() || r.ptr != last) {
            return false;
        }
        *out = v;
        return true;
    }

    static std::string_view strip_one_quote_pair(std::string_view s) noexcept
    {
        if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
            return s.substr(1, s.size() - 2);
        }
        return s;
    }

}  // namespace

int64_t
MtlValue::as_int(int64_t fallback) const noexcept
{
    return (kind == MtlValueKind::Int) ? i64 : fallback;
}


double
MtlValue::as_float(double fallback) const noexcept
{
    if (kind == MtlValueKind::Float) {
        return f64;
    }
    if (kind == MtlValueKind::Int) {
        return static_cast<double>(i64);
    }
    return fallback;
}


std::string_view
MtlValue::as_text(std::string_view fallback) const noexcept
{
    return (kind == MtlValueKind::Text) ? std::string_view(text) : fallback;
}


MtlValue
make_int(int64_t v)
{
    MtlValue out;
    out.kind = MtlValueKind::Int;
    out.i64  = v;
    return out;
}


MtlValue
make_float(double v)
{
    MtlValue out;
    out.kind = MtlValueKind::Float;
    out.f64  = v;
    return out;
}


MtlValue
make_text(std::string_view s)
{
    MtlValue out;
    out.kind = MtlValueKind::Text;
    out.text.assign(s.data(), s.size());
    return out;
}


bool
operator==(const MtlValue& a, const MtlValue& b) noexcept
{
    if (a.kind != b.kind) {
        return false;
    }
    switch (a.kind) {
    case MtlValueKind::Empty: return true;
    case MtlValueKind::Int: return a.i64 == b.i64;
    case MtlValueKind::Float: return a.f64 == b.f64;
    case MtlValueKind::Text: return a.text == b.text;
    }
    return false;
}


MtlValue
cast_to_best(std::string_view raw)
{
    int64_t i = 0;
    if (parse_i64(raw, &i)) {
        return make_int(i);
    }
    double f = 0.0;
    if (parse_f64(raw, &f)) {
        return make_float(f);
    }
    return make_text(strip_one_quote_pair(raw));
}


void
append_value_string(const MtlValue& v, std::string* out)
{
    if (!out) {
        return;
    }
    char buf[64];
    switch (v.kind) {
    case MtlValueKind::Empty: return;
    case MtlValueKind::Int: {
        const std::to_chars_result r = std::to_chars(buf, buf + sizeof(buf),
                                                     v.i64);
        out->append(buf, static_cast<size_t>(r.ptr - buf));
        return;
    }
    case MtlValueKind::Float: {
        const std::to_chars_result r = std::to_chars(buf, buf + sizeof(buf),
                                                     v.f64);
        out->append(buf, static_cast<size_t>(r.ptr - buf));
        return;
    }
    case MtlValueKind::Text: out->append(v.text); return;
    }
}

}  // namespace openmtl
