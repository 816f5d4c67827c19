#pragma once

#include <cstdint>
#include <string>
#include <string_view>

/**
 * \file mtl_value.h
 * \brief Typed MTL value (int/float/text) and the best-type caster.
 */

namespace openmtl {

/// Value kind of an \ref MtlValue.
enum class MtlValueKind : uint8_t {
    Empty,
    Int,
    Float,
    Text,
};

/**
 * \brief A typed value parsed from the right-hand side of `key = value`.
 *
 * Exactly one of \ref i64, \ref f64 or \ref text is meaningful, selected by
 * \ref kind. Text values hold their content with one layer of surrounding
 * double quotes removed.
 */
struct MtlValue final {
    MtlValueKind kind = MtlValueKind::Empty;
    int64_t i64       = 0;
    double f64        = 0.0;
    std::string text;

    bool is_int() const noexcept { return kind == MtlValueKind::Int; }
    bool is_float() const noexcept { return kind == MtlValueKind::Float; }
    bool is_text() const noexcept { return kind == MtlValueKind::Text; }
    bool empty() const noexcept { return kind == MtlValueKind::Empty; }

    /// Returns the integer value, or \p fallback when not an integer.
    int64_t as_int(int64_t fallback = 0) const noexcept;
    /// Returns the numeric value (int widened to double), or \p fallback.
    double as_float(double fallback = 0.0) const noexcept;
    /// Returns the text value, or \p fallback when not text.
    std::string_view as_text(std::string_view fallback = {}) const noexcept;
};

MtlValue
make_int(int64_t v);
MtlValue
make_float(double v);
MtlValue
make_text(std::string_view s);

bool
operator==(const MtlValue& a, const MtlValue& b) noexcept;

/**
 * \brief Converts a raw token into the best-fitting typed value.
 *
 * Ordered fallback:
 * 1. integer (optional sign, decimal digits, fits in int64)
 * 2. floating point (any form accepted by `std::from_chars`, including
 *    exponents, `inf` and `nan`)
 * 3. text, with a single matching pair of surrounding `"` removed
 *
 * The whole token must be consumed for 1. and 2. to succeed. Never fails.
 *
 * Integers are limited to int64. A decimal integer outside that range is
 * not rejected; it falls through to 2. and is kept as the nearest double,
 * so digits beyond double precision are lost. MTL files carry no integer
 * fields that wide.
 */
MtlValue
cast_to_best(std::string_view raw);

/// Appends a canonical representation of \p v (ints in decimal, floats in
/// shortest round-trip form, text verbatim) to \p out.
void
append_value_string(const MtlValue& v, std::string* out);

}  // namespace openmtl
