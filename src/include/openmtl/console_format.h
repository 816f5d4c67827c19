#pragma once

#include "openmtl/mtl_value.h"

#include <cstdint>
#include <string>
#include <string_view>

namespace openmtl {

// Appends an ASCII-only, terminal-safe representation of `s` into `out`.
//
// Behavior:
// - Escapes `\`, `"`, `\n`, `\r`, `\t`
// - Escapes other control bytes and non-ASCII as `\xNN`
// - Truncates to `max_bytes` bytes (0 = unlimited) and appends "..."
//
// Returns true when any escaping of control bytes or truncation occurred.
bool
append_console_escaped_ascii(std::string_view s, uint32_t max_bytes,
                             std::string* out) noexcept;

// Appends `v` for display: integers and floats as numbers, text quoted and
// escaped, empty values as `-`.
void
append_console_value(const MtlValue& v, uint32_t max_bytes, std::string* out);

// Returns a short name for the kind of `v` ("int", "float", "text", "empty").
std::string_view
value_kind_name(MtlValueKind kind) noexcept;

}  // namespace openmtl
